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
#include "host/libs/sandbox/restrict.h"

#include <map>
#include <string>
#include <string_view>

#include <absl/log/log.h>
#include <absl/log/vlog_is_on.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/landlock.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/reserved_mounts.h"
#include "host/libs/sandbox/rule_resolver.h"
#include "host/libs/sandbox/seccomp.h"

namespace shellbox {
namespace linux_sandbox {

absl::Status ApplySandboxPolicy(const SandboxPolicy& policy,
                                std::string_view cwd,
                                const std::map<std::string, std::string>& env) {
  ResolvedRules rules = ResolveRules(policy, cwd, env);
  if (VLOG_IS_ON(1)) {
    VLOG(1) << policy;
    VLOG(1) << rules;
  }

  absl::StatusOr<ReservedProtection> protection = ProtectReservedPaths(rules);
  if (!protection.ok()) {
    return protection.status();
  }
  VLOG(1) << "Reserved paths: " << *protection;

  if (absl::Status fs = ApplyFilesystemRules(rules, *protection); !fs.ok()) {
    return fs;
  }
  if (!rules.network_allowed) {
    if (absl::Status net = InstallNetworkFilter(); !net.ok()) {
      return net;
    }
  }
  return absl::OkStatus();
}

}  // namespace linux_sandbox
}  // namespace shellbox
