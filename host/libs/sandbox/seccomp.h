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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_SECCOMP_H
#define SHELLBOX_HOST_LIBS_SANDBOX_SECCOMP_H

#include <linux/filter.h>

#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace shellbox {
namespace linux_sandbox {

/** A seccomp program that leaves Unix domain sockets usable and refuses every
 * other way of reaching the network with EPERM.
 *
 * Syscalls made through a foreign calling convention (32-bit compat, x32) kill
 * the process with SIGSYS, because syscall numbers differ there and would slip
 * past the checks. */
absl::StatusOr<std::vector<sock_filter>> BuildNetworkFilter();

/** Installs `BuildNetworkFilter()` on the calling thread. The filter survives
 * `fork` and `execve` and cannot be removed. */
absl::Status InstallNetworkFilter();

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
