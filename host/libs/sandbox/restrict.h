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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_RESTRICT_H
#define SHELLBOX_HOST_LIBS_SANDBOX_RESTRICT_H

#include <map>
#include <string>
#include <string_view>

#include <absl/status/status.h>

#include "host/libs/sandbox/policy.h"

namespace shellbox {
namespace linux_sandbox {

/** Confines the calling process to `policy` for a command running in `cwd`.
 *
 * Resolves the policy, protects reserved paths, applies the Landlock ruleset
 * and, unless the policy allows network access, installs the seccomp network
 * filter. Every step is irreversible, so on error the caller must not run the
 * command. */
absl::Status ApplySandboxPolicy(const SandboxPolicy& policy,
                                std::string_view cwd,
                                const std::map<std::string, std::string>& env);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
