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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_RULE_RESOLVER_H
#define SHELLBOX_HOST_LIBS_SANDBOX_RULE_RESOLVER_H

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>

#include "host/libs/sandbox/policy.h"

namespace shellbox {
namespace linux_sandbox {

/** Directory names kept read-only when they are direct children of a writable
 * root. */
inline constexpr std::string_view kReservedDirectoryNames[] = {".git",
                                                               ".codex"};

struct ResolvedRules {
  /** Directories (or files) the sandboxed process may write beneath. */
  std::set<std::string> writable;
  /** Paths that stay read-only even though an ancestor is writable. */
  std::set<std::string> reserved_readonly;
  bool full_disk_write = false;
  bool network_allowed = false;

  bool operator==(const ResolvedRules&) const = default;
};

std::ostream& operator<<(std::ostream& out, const ResolvedRules& rules);

/** Turns `policy` into concrete paths for a command running in `cwd` with the
 * environment `env`.
 *
 * Pure: only the arguments are consulted, never the filesystem or the
 * environment of the calling process, so identical inputs always give identical
 * rules. */
ResolvedRules ResolveRules(const SandboxPolicy& policy, std::string_view cwd,
                           const std::map<std::string, std::string>& env);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
