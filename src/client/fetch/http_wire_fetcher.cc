/*
 * Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "client/fetch/http_wire_fetcher.h"

#include <brpc/controller.h>
#include <brpc/http_status_code.h>
#include <brpc/policy/gzip_compress.h>
#include <butil/time.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include "common/metrics/reader_metric.h"
#include "common/options/reader.h"

namespace chunkfs {
namespace client {

using metrics::ReaderMetric;

static const std::string kHttpScheme = "http://";

static bool SplitHost(const std::string& url, std::string* host) {
  if (url.compare(0, kHttpScheme.size(), kHttpScheme) != 0) {
    return false;
  }

  auto end = url.find('/', kHttpScheme.size());
  if (end == std::string::npos || end == kHttpScheme.size()) {
    return false;
  }

  *host = url.substr(kHttpScheme.size(), end - kHttpScheme.size());
  return true;
}

Status HttpWireFetcher::Fetch(const std::vector<std::string>& urls,
                              const std::string& cipher_key,
                              bool is_compressed, IOBuffer* data) {
  if (!cipher_key.empty()) {
    return Status::NotSupport("encrypted chunk is not supported");
  }

  if (urls.empty()) {
    return Status::FetchFailed("no candidate url");
  }

  Status status;
  for (const auto& url : urls) {
    butil::Timer timer;
    timer.start();
    status = FetchOne(url, is_compressed, data);
    timer.stop();

    ReaderMetric::GetInstance().wire_fetch.Update(status.ok(), data->Size(),
                                                  timer.u_elapsed());
    if (status.ok()) {
      return status;
    }

    LOG(WARNING) << fmt::format("[wire.fetch] fetch {} failed, status({}).",
                                url, status.ToString());
  }

  return Status::FetchFailed(
      fmt::format("all {} candidate urls failed", urls.size()),
      status.ToString());
}

Status HttpWireFetcher::FetchOne(const std::string& url, bool is_compressed,
                                 IOBuffer* data) {
  data->Clear();

  std::string host;
  if (!SplitHost(url, &host)) {
    return Status::InvalidParam("invalid url", url);
  }

  auto channel = GetOrCreateChannel(host);
  if (channel == nullptr) {
    return Status::NetError("init channel fail", host);
  }

  brpc::Controller cntl;
  cntl.set_timeout_ms(FLAGS_wire_fetch_timeout_ms);
  cntl.http_request().uri() = url;
  cntl.http_request().set_method(brpc::HTTP_METHOD_GET);
  if (is_compressed) {
    cntl.http_request().SetHeader("Accept-Encoding", "gzip");
  }

  channel->CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);
  if (cntl.Failed()) {
    if (cntl.ErrorCode() == brpc::ERPCTIMEDOUT) {
      return Status::Timeout(cntl.ErrorCode(), cntl.ErrorText());
    }
    return Status::NetError(cntl.ErrorCode(), cntl.ErrorText());
  }

  int status_code = cntl.http_response().status_code();
  if (status_code != brpc::HTTP_STATUS_OK) {
    if (status_code == brpc::HTTP_STATUS_NOT_FOUND) {
      return Status::NotFound("chunk not found", url);
    }
    return Status::IoError(fmt::format("http status {}", status_code), url);
  }

  const std::string* encoding =
      cntl.http_response().GetHeader("Content-Encoding");
  if (encoding != nullptr && *encoding == "gzip") {
    butil::IOBuf decompressed;
    if (!brpc::policy::GzipDecompress(cntl.response_attachment(),
                                      &decompressed)) {
      return Status::IoError("gunzip chunk failed", url);
    }
    *data = IOBuffer(decompressed);
  } else {
    *data = IOBuffer(cntl.response_attachment());
  }

  VLOG(6) << fmt::format("[wire.fetch] fetch {} success, size({}).", url,
                         data->Size());
  return Status::OK();
}

HttpWireFetcher::ChannelSPtr HttpWireFetcher::GetOrCreateChannel(
    const std::string& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = channels_.find(host);
  if (iter != channels_.end()) {
    return iter->second;
  }

  brpc::ChannelOptions options;
  options.protocol = brpc::PROTOCOL_HTTP;
  options.timeout_ms = FLAGS_wire_fetch_timeout_ms;
  options.max_retry = 0;

  auto channel = std::make_shared<brpc::Channel>();
  if (channel->Init(host.c_str(), &options) != 0) {
    LOG(ERROR) << fmt::format("[wire.fetch] init channel fail, host({}).",
                              host);
    return nullptr;
  }

  channels_.emplace(host, channel);
  return channel;
}

}  // namespace client
}  // namespace chunkfs
