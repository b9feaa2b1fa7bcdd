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
#include "host/libs/sandbox/helper_path.h"

#include <limits.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/filesystem.h"

namespace shellbox {
namespace linux_sandbox {

absl::StatusOr<std::string> ExecutableSelfPath() {
  char exe_path[PATH_MAX + 1];
  ssize_t path_size = readlink("/proc/self/exe", exe_path, PATH_MAX);
  if (path_size < 0) {
    return absl::ErrnoToStatus(errno, "`readlink(/proc/self/exe)` failed");
  }
  exe_path[path_size] = '\0';  // Readlink does not append a null terminator
  char abs_path[PATH_MAX];
  if (realpath(exe_path, abs_path) == nullptr) {
    return absl::ErrnoToStatus(errno, "`realpath` failed");
  }
  return std::string(abs_path);
}

absl::StatusOr<std::string> SiblingExecutablePath(std::string_view name) {
  absl::StatusOr<std::string> self = ExecutableSelfPath();
  if (!self.ok()) {
    return self.status();
  }
  return JoinPath(Dirname(*self), name);
}

absl::StatusOr<std::string> DefaultLinuxSandboxExe() {
  static const absl::StatusOr<std::string>* const kPath =
      new absl::StatusOr<std::string>(
          SiblingExecutablePath(kLinuxSandboxExeName));
  return *kPath;
}

}  // namespace linux_sandbox
}  // namespace shellbox
