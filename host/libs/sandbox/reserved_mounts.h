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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_RESERVED_MOUNTS_H
#define SHELLBOX_HOST_LIBS_SANDBOX_RESERVED_MOUNTS_H

#include <ostream>
#include <set>
#include <string>

#include <absl/status/statusor.h>

#include "host/libs/sandbox/rule_resolver.h"

namespace shellbox {
namespace linux_sandbox {

/** How the reserved paths beneath writable roots are kept read-only. Landlock
 * rules only add access, so this has to happen outside of the ruleset. */
struct ReservedProtection {
  enum class Method {
    /** Nothing to protect. */
    kNone,
    /** Each path is a read-only bind mount in a private mount namespace. */
    kReadOnlyMounts,
    /** The Landlock applier grants around the paths instead of granting the
     * writable roots that contain them. */
    kSplitGrants,
  };

  Method method = Method::kNone;
  /** Reserved paths that exist on disk. */
  std::set<std::string> paths;
};

std::ostream& operator<<(std::ostream& out, const ReservedProtection& value);

/** Makes every existing path of `rules.reserved_readonly` read-only for the
 * calling process and whatever it later executes.
 *
 * Enters a new user and mount namespace, which requires the caller to be
 * single threaded. When namespaces are unavailable the returned protection
 * asks for split grants. */
absl::StatusOr<ReservedProtection> ProtectReservedPaths(
    const ResolvedRules& rules);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
