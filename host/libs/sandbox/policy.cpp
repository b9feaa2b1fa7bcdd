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
#include "host/libs/sandbox/policy.h"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <json/json.h>

namespace shellbox {
namespace linux_sandbox {
namespace {

constexpr char kModeKey[] = "mode";
constexpr char kWritableRootsKey[] = "writable_roots";
constexpr char kNetworkAccessKey[] = "network_access";
constexpr char kExcludeTmpdirEnvVarKey[] = "exclude_tmpdir_env_var";
constexpr char kExcludeSlashTmpKey[] = "exclude_slash_tmp";

const std::vector<std::string>& EmptyRoots() {
  static const auto* kEmpty = new std::vector<std::string>();
  return *kEmpty;
}

absl::StatusOr<bool> OptionalBool(const Json::Value& root, const char* key) {
  if (!root.isMember(key)) {
    return false;
  }
  if (!root[key].isBool()) {
    return absl::InvalidArgumentError(absl::StrCat("'", key, "' not a bool"));
  }
  return root[key].asBool();
}

}  // namespace

SandboxPolicy::SandboxPolicy(Mode mode, WorkspaceWriteOptions options)
    : mode_(mode), workspace_(std::move(options)) {}

SandboxPolicy SandboxPolicy::ReadOnly() {
  return SandboxPolicy(Mode::kReadOnly, {});
}

SandboxPolicy SandboxPolicy::WorkspaceWrite(WorkspaceWriteOptions options) {
  return SandboxPolicy(Mode::kWorkspaceWrite, std::move(options));
}

SandboxPolicy SandboxPolicy::DangerFullAccess() {
  return SandboxPolicy(Mode::kDangerFullAccess, {});
}

bool SandboxPolicy::HasFullDiskWriteAccess() const {
  return mode_ == Mode::kDangerFullAccess;
}

bool SandboxPolicy::HasFullNetworkAccess() const {
  switch (mode_) {
    case Mode::kReadOnly:
      return false;
    case Mode::kWorkspaceWrite:
      return workspace_.network_access;
    case Mode::kDangerFullAccess:
      return true;
  }
  return false;
}

const std::vector<std::string>& SandboxPolicy::WritableRoots() const {
  return mode_ == Mode::kWorkspaceWrite ? workspace_.writable_roots
                                        : EmptyRoots();
}

bool SandboxPolicy::ExcludeTmpdirEnvVar() const {
  return mode_ == Mode::kWorkspaceWrite && workspace_.exclude_tmpdir_env_var;
}

bool SandboxPolicy::ExcludeSlashTmp() const {
  return mode_ == Mode::kWorkspaceWrite && workspace_.exclude_slash_tmp;
}

bool SandboxPolicy::operator==(const SandboxPolicy& other) const {
  if (mode_ != other.mode_) {
    return false;
  }
  if (mode_ != Mode::kWorkspaceWrite) {
    return true;
  }
  return workspace_.writable_roots == other.workspace_.writable_roots &&
         workspace_.network_access == other.workspace_.network_access &&
         workspace_.exclude_tmpdir_env_var ==
             other.workspace_.exclude_tmpdir_env_var &&
         workspace_.exclude_slash_tmp == other.workspace_.exclude_slash_tmp;
}

std::string SandboxPolicy::ToJson() const {
  Json::Value root(Json::objectValue);
  root[kModeKey] = std::string(ModeName(mode_));
  if (mode_ == Mode::kWorkspaceWrite) {
    Json::Value roots(Json::arrayValue);
    for (const auto& writable_root : workspace_.writable_roots) {
      roots.append(writable_root);
    }
    root[kWritableRootsKey] = roots;
    root[kNetworkAccessKey] = workspace_.network_access;
    root[kExcludeTmpdirEnvVarKey] = workspace_.exclude_tmpdir_env_var;
    root[kExcludeSlashTmpKey] = workspace_.exclude_slash_tmp;
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

absl::StatusOr<SandboxPolicy> SandboxPolicy::FromJson(std::string_view json) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Failed to parse policy JSON: ", errors));
  }
  if (!root.isObject() || !root[kModeKey].isString()) {
    return absl::InvalidArgumentError("Policy JSON needs a string 'mode'");
  }

  std::string mode = root[kModeKey].asString();
  if (mode == ModeName(Mode::kReadOnly)) {
    return ReadOnly();
  } else if (mode == ModeName(Mode::kDangerFullAccess)) {
    return DangerFullAccess();
  } else if (mode != ModeName(Mode::kWorkspaceWrite)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unknown sandbox mode '%s'", mode));
  }

  WorkspaceWriteOptions options;
  if (root.isMember(kWritableRootsKey)) {
    const Json::Value& roots = root[kWritableRootsKey];
    if (!roots.isArray()) {
      return absl::InvalidArgumentError("'writable_roots' not an array");
    }
    for (const auto& writable_root : roots) {
      if (!writable_root.isString()) {
        return absl::InvalidArgumentError("'writable_roots' member not a string");
      }
      options.writable_roots.emplace_back(writable_root.asString());
    }
  }
  absl::StatusOr<bool> network_access = OptionalBool(root, kNetworkAccessKey);
  if (!network_access.ok()) {
    return network_access.status();
  }
  options.network_access = *network_access;
  absl::StatusOr<bool> exclude_tmpdir =
      OptionalBool(root, kExcludeTmpdirEnvVarKey);
  if (!exclude_tmpdir.ok()) {
    return exclude_tmpdir.status();
  }
  options.exclude_tmpdir_env_var = *exclude_tmpdir;
  absl::StatusOr<bool> exclude_slash_tmp =
      OptionalBool(root, kExcludeSlashTmpKey);
  if (!exclude_slash_tmp.ok()) {
    return exclude_slash_tmp.status();
  }
  options.exclude_slash_tmp = *exclude_slash_tmp;
  return WorkspaceWrite(std::move(options));
}

std::string_view ModeName(SandboxPolicy::Mode mode) {
  switch (mode) {
    case SandboxPolicy::Mode::kReadOnly:
      return "read-only";
    case SandboxPolicy::Mode::kWorkspaceWrite:
      return "workspace-write";
    case SandboxPolicy::Mode::kDangerFullAccess:
      return "danger-full-access";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, const SandboxPolicy& policy) {
  out << "SandboxPolicy { mode: " << ModeName(policy.GetMode());
  if (policy.GetMode() == SandboxPolicy::Mode::kWorkspaceWrite) {
    out << ", writable_roots: [" << absl::StrJoin(policy.WritableRoots(), ", ")
        << "], network_access: " << policy.HasFullNetworkAccess()
        << ", exclude_tmpdir_env_var: " << policy.ExcludeTmpdirEnvVar()
        << ", exclude_slash_tmp: " << policy.ExcludeSlashTmp();
  }
  return out << " }";
}

}  // namespace linux_sandbox
}  // namespace shellbox
