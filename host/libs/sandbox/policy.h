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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_POLICY_H
#define SHELLBOX_HOST_LIBS_SANDBOX_POLICY_H

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace shellbox {
namespace linux_sandbox {

/** What a sandboxed command may do. Built once per invocation and never
 * modified afterwards; every consumer takes it by const reference. */
class SandboxPolicy {
 public:
  enum class Mode {
    kReadOnly,
    kWorkspaceWrite,
    kDangerFullAccess,
  };

  struct WorkspaceWriteOptions {
    std::vector<std::string> writable_roots;
    bool network_access = false;
    /** Do not grant the directory named by $TMPDIR. */
    bool exclude_tmpdir_env_var = false;
    /** Do not grant `/tmp`. */
    bool exclude_slash_tmp = false;
  };

  /** No filesystem writes, no network. */
  static SandboxPolicy ReadOnly();
  /** Writes limited to the given roots (plus the cwd and temp dirs). */
  static SandboxPolicy WorkspaceWrite(WorkspaceWriteOptions options);
  /** No restrictions at all. */
  static SandboxPolicy DangerFullAccess();

  /** Parses the JSON form passed to the helper binary. */
  static absl::StatusOr<SandboxPolicy> FromJson(std::string_view json);
  std::string ToJson() const;

  Mode GetMode() const { return mode_; }
  bool HasFullDiskWriteAccess() const;
  bool HasFullNetworkAccess() const;

  /** Empty unless the mode is kWorkspaceWrite. */
  const std::vector<std::string>& WritableRoots() const;
  bool ExcludeTmpdirEnvVar() const;
  bool ExcludeSlashTmp() const;

  bool operator==(const SandboxPolicy&) const;

 private:
  SandboxPolicy(Mode mode, WorkspaceWriteOptions options);

  Mode mode_;
  WorkspaceWriteOptions workspace_;
};

std::string_view ModeName(SandboxPolicy::Mode mode);

std::ostream& operator<<(std::ostream& out, const SandboxPolicy& policy);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
