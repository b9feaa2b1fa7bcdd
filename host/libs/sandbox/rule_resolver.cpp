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
#include "host/libs/sandbox/rule_resolver.h"

#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>

#include <absl/strings/match.h>
#include <absl/strings/str_join.h>

#include "host/libs/sandbox/filesystem.h"
#include "host/libs/sandbox/policy.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

constexpr char kSlashTmp[] = "/tmp";
constexpr char kTmpdirEnvVar[] = "TMPDIR";

std::string Absolute(std::string_view path, std::string_view cwd) {
  if (absl::StartsWith(path, "/")) {
    return CleanPath(path);
  }
  return CleanPath(JoinPath(cwd, path));
}

bool WithinAny(const std::string& path, const std::set<std::string>& roots) {
  for (const auto& root : roots) {
    if (IsPathWithin(path, root)) {
      return true;
    }
  }
  return false;
}

}  // namespace

ResolvedRules ResolveRules(const SandboxPolicy& policy, std::string_view cwd,
                           const std::map<std::string, std::string>& env) {
  ResolvedRules rules;
  rules.network_allowed = policy.HasFullNetworkAccess();
  rules.full_disk_write = policy.HasFullDiskWriteAccess();
  if (rules.full_disk_write ||
      policy.GetMode() != SandboxPolicy::Mode::kWorkspaceWrite) {
    return rules;
  }

  std::string clean_cwd = CleanPath(cwd);
  std::optional<std::string> tmpdir;
  if (auto it = env.find(kTmpdirEnvVar); it != env.end() && !it->second.empty()) {
    tmpdir = Absolute(it->second, clean_cwd);
  }

  std::set<std::string> candidates;
  for (const auto& root : policy.WritableRoots()) {
    candidates.emplace(Absolute(root, clean_cwd));
  }
  candidates.emplace(clean_cwd);
  if (!policy.ExcludeSlashTmp()) {
    candidates.emplace(kSlashTmp);
  }
  if (tmpdir && !policy.ExcludeTmpdirEnvVar()) {
    candidates.emplace(*tmpdir);
  }

  for (const auto& root : candidates) {
    for (std::string_view name : kReservedDirectoryNames) {
      rules.reserved_readonly.emplace(JoinPath(root, name));
    }
  }

  for (const auto& path : candidates) {
    if (WithinAny(path, rules.reserved_readonly)) {
      continue;
    }
    if (policy.ExcludeSlashTmp() && path == kSlashTmp) {
      continue;
    }
    if (policy.ExcludeTmpdirEnvVar() && tmpdir && path == *tmpdir) {
      continue;
    }
    rules.writable.emplace(path);
  }

  // Reserved entries are only meaningful beneath something writable.
  std::erase_if(rules.reserved_readonly, [&rules](const std::string& reserved) {
    return !WithinAny(reserved, rules.writable);
  });
  return rules;
}

std::ostream& operator<<(std::ostream& out, const ResolvedRules& rules) {
  out << "ResolvedRules {\n";
  out << "\twritable: [" << absl::StrJoin(rules.writable, ", ") << "]\n";
  out << "\treserved_readonly: ["
      << absl::StrJoin(rules.reserved_readonly, ", ") << "]\n";
  out << "\tfull_disk_write: " << rules.full_disk_write << "\n";
  out << "\tnetwork_allowed: " << rules.network_allowed << "\n";
  return out << "}";
}

}  // namespace linux_sandbox
}  // namespace shellbox
