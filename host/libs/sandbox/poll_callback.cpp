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

#include "host/libs/sandbox/poll_callback.h"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/time/time.h>

namespace shellbox {
namespace linux_sandbox {
namespace {

int TimeoutMillis(absl::Duration timeout) {
  if (timeout == absl::InfiniteDuration()) {
    return -1;
  }
  // Round up so a sub-millisecond remainder does not spin.
  absl::Duration rounded = absl::Ceil(timeout, absl::Milliseconds(1));
  return static_cast<int>(
      std::clamp<int64_t>(absl::ToInt64Milliseconds(rounded), 0, INT32_MAX));
}

}  // namespace

void PollCallback::Add(int fd, std::function<absl::Status(short)> cb) {
  pollfds_.push_back({.fd = fd, .events = POLLIN, .revents = 0});
  callbacks_.push_back(std::move(cb));
}

void PollCallback::Remove(int fd) {
  // Negative descriptors are skipped by `poll`.
  for (auto& poll_fd : pollfds_) {
    if (poll_fd.fd == fd) {
      poll_fd.fd = -1;
      poll_fd.revents = 0;
    }
  }
}

bool PollCallback::Empty() const {
  return std::none_of(pollfds_.begin(), pollfds_.end(),
                      [](const pollfd& poll_fd) { return poll_fd.fd >= 0; });
}

absl::Status PollCallback::Poll(absl::Duration timeout) {
  int ready = poll(pollfds_.data(), pollfds_.size(), TimeoutMillis(timeout));
  if (ready < 0 && errno == EINTR) {
    return absl::OkStatus();  // Caller re-checks its deadline
  } else if (ready < 0) {
    return absl::ErrnoToStatus(errno, "`poll` failed");
  }
  VLOG(2) << ready << " of " << pollfds_.size() << " descriptors ready";

  for (std::size_t i = 0; i < pollfds_.size(); i++) {
    // A callback may `Remove` any descriptor, including ones not yet visited.
    if (pollfds_[i].fd < 0 || pollfds_[i].revents == 0) {
      continue;
    }
    if (absl::Status status = callbacks_[i](pollfds_[i].revents);
        !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

}  // namespace linux_sandbox
}  // namespace shellbox
