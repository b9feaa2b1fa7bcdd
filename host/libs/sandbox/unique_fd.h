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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_UNIQUE_FD_H
#define SHELLBOX_HOST_LIBS_SANDBOX_UNIQUE_FD_H

#include <sys/types.h>

#include <string>
#include <utility>

#include <absl/status/statusor.h>

namespace shellbox {
namespace linux_sandbox {

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd);
  UniqueFd(UniqueFd&&);
  UniqueFd(const UniqueFd&) = delete;
  ~UniqueFd();
  UniqueFd& operator=(UniqueFd&&);

  /** Opens `path` with `flags`, always adding O_CLOEXEC. `mode` only matters
   * with O_CREAT. */
  static absl::StatusOr<UniqueFd> Open(const std::string& path, int flags,
                                       mode_t mode = 0644);

  /** Returns {read end, write end} of a new O_CLOEXEC pipe. */
  static absl::StatusOr<std::pair<UniqueFd, UniqueFd>> Pipe();

  int Get() const;
  /** Closes the owned descriptor, if any, and takes ownership of `fd`. */
  void Reset(int fd);

 private:
  int fd_ = -1;
};

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
