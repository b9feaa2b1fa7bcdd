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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_LANDLOCK_H
#define SHELLBOX_HOST_LIBS_SANDBOX_LANDLOCK_H

#include <cstdint>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/reserved_mounts.h"
#include "host/libs/sandbox/rule_resolver.h"
#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {

/** Landlock ABI version of the running kernel, or an error when Landlock is
 * not built in or disabled. */
absl::StatusOr<int> LandlockAbiVersion();

/** A Landlock ruleset being assembled. Rules only ever add access; anything
 * handled by the ruleset and not granted by a rule is denied once
 * `RestrictSelf` runs. */
class LandlockRuleset {
 public:
  /** Handles every filesystem access right known to the running kernel. */
  static absl::StatusOr<LandlockRuleset> Create();

  LandlockRuleset(LandlockRuleset&&) = default;
  LandlockRuleset& operator=(LandlockRuleset&&) = default;

  /** Read and execute access beneath `path`. */
  absl::Status AllowRead(const std::string& path);
  /** Read, execute and write access beneath `path`. Only file rights are
   * granted when `path` is not a directory. Returns a NOT_FOUND status when
   * `path` does not exist. */
  absl::Status AllowReadWrite(const std::string& path);

  int AbiVersion() const { return abi_; }
  std::uint64_t HandledAccess() const { return handled_access_; }

 private:
  LandlockRuleset(UniqueFd fd, int abi, std::uint64_t handled_access);

  absl::Status AddPathBeneath(const std::string& path, std::uint64_t access);

  friend absl::Status RestrictSelf(LandlockRuleset ruleset);

  UniqueFd fd_;
  int abi_;
  std::uint64_t handled_access_;
};

/** Enforces `ruleset` on the calling thread and every process it later
 * creates. There is no way back: the ruleset is consumed, and nothing applied
 * afterwards can widen access. Sets PR_SET_NO_NEW_PRIVS first. */
absl::Status RestrictSelf(LandlockRuleset ruleset);

/** Read access everywhere, write access to `rules.writable` and /dev/null.
 *
 * With kSplitGrants protection, writable directories holding a protected path
 * are not granted themselves; their other entries are granted one by one. */
absl::Status ApplyFilesystemRules(const ResolvedRules& rules,
                                  const ReservedProtection& protection);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
