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
#include "host/libs/sandbox/unique_fd.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace shellbox {
namespace linux_sandbox {

UniqueFd::UniqueFd(int fd) : fd_(fd) {}

UniqueFd::UniqueFd(UniqueFd&& other) : fd_(std::exchange(other.fd_, -1)) {}

UniqueFd::~UniqueFd() { Reset(-1); }

UniqueFd& UniqueFd::operator=(UniqueFd&& other) {
  if (this != &other) {
    Reset(std::exchange(other.fd_, -1));
  }
  return *this;
}

absl::StatusOr<UniqueFd> UniqueFd::Open(const std::string& path, int flags,
                                        mode_t mode) {
  UniqueFd fd(open(path.c_str(), flags | O_CLOEXEC, mode));
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`open(", path, ")` failed"));
  }
  return fd;
}

absl::StatusOr<std::pair<UniqueFd, UniqueFd>> UniqueFd::Pipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return absl::ErrnoToStatus(errno, "`pipe2` failed");
  }
  return std::make_pair(UniqueFd(fds[0]), UniqueFd(fds[1]));
}

int UniqueFd::Get() const { return fd_; }

void UniqueFd::Reset(int fd) {
  int previous = std::exchange(fd_, fd);
  // EINTR from `close` still releases the descriptor on Linux.
  if (previous >= 0 && close(previous) < 0 && errno != EINTR) {
    PLOG(ERROR) << "Failed to close fd " << previous;
  }
}

}  // namespace linux_sandbox
}  // namespace shellbox
