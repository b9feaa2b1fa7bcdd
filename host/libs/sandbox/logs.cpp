/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "host/libs/sandbox/logs.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>
#include <absl/log/log_sink_registry.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

/* Appends records to one file. The helper and its launcher may share a log
 * file, so each record names the process that wrote it and goes out in a
 * single `O_APPEND` write. */
class AppendingFileSink final : public absl::LogSink {
 public:
  static absl::StatusOr<std::unique_ptr<AppendingFileSink>> Open(
      const std::string& path) {
    // O_CLOEXEC keeps the log out of sandboxed commands.
    absl::StatusOr<UniqueFd> fd =
        UniqueFd::Open(path, O_APPEND | O_CREAT | O_WRONLY);
    if (!fd.ok()) {
      return fd.status();
    }
    auto tag = absl::StrCat(program_invocation_short_name, "[", getpid(), "] ");
    return std::unique_ptr<AppendingFileSink>(
        new AppendingFileSink(std::move(*fd), std::move(tag)));
  }
  AppendingFileSink(AppendingFileSink&) = delete;

  void Send(const absl::LogEntry& entry) override {
    std::string record = absl::StrCat(
        tag_, entry.text_message_with_prefix_and_newline(), entry.stacktrace());
    std::string_view pending = record;
    while (!pending.empty()) {
      ssize_t written = write(fd_.Get(), pending.data(), pending.size());
      if (written >= 0) {
        pending.remove_prefix(written);
      } else if (errno != EINTR) {
        // Not LOG: this sink would receive the message again.
        std::cerr << "Writing log record to fd " << fd_.Get()
                  << " failed: " << strerror(errno) << '\n';
        return;
      }
    }
  }

 private:
  AppendingFileSink(UniqueFd fd, std::string tag)
      : fd_(std::move(fd)), tag_(std::move(tag)) {}

  UniqueFd fd_;
  std::string tag_;
};

}  // namespace

absl::Status LogToFiles(const std::vector<std::string>& paths) {
  for (const std::string& path : paths) {
    absl::StatusOr<std::unique_ptr<AppendingFileSink>> sink =
        AppendingFileSink::Open(path);
    if (!sink.ok()) {
      return sink.status();
    }
    // Registered sinks must outlive every LOG call, so they are never freed.
    absl::AddLogSink(sink->release());
  }
  return absl::OkStatus();
}

}  // namespace linux_sandbox
}  // namespace shellbox
