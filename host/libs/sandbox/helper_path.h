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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_HELPER_PATH_H
#define SHELLBOX_HOST_LIBS_SANDBOX_HELPER_PATH_H

#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace shellbox {
namespace linux_sandbox {

inline constexpr char kLinuxSandboxExeName[] = "shellbox_linux_sandbox";

/** Absolute, symlink free path of the running executable. */
absl::StatusOr<std::string> ExecutableSelfPath();

/** `name` in the directory of the running executable. */
absl::StatusOr<std::string> SiblingExecutablePath(std::string_view name);

/** Where the helper is expected when the caller does not name one: next to
 * the running executable. Resolved once per process. */
absl::StatusOr<std::string> DefaultLinuxSandboxExe();

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
