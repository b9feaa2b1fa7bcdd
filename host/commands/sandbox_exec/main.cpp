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

#include <limits.h>
#include <unistd.h>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "host/libs/sandbox/exec_error.h"
#include "host/libs/sandbox/executor.h"
#include "host/libs/sandbox/logs.h"
#include "host/libs/sandbox/outcome.h"
#include "host/libs/sandbox/policy.h"

ABSL_FLAG(std::string, mode, "read-only",
          "One of read-only, workspace-write, danger-full-access");
ABSL_FLAG(std::vector<std::string>, writable_roots, std::vector<std::string>(),
          "Extra writable directories in workspace-write mode");
ABSL_FLAG(bool, network_access, false, "Allow network in workspace-write mode");
ABSL_FLAG(bool, exclude_tmpdir_env_var, false,
          "Do not make $TMPDIR writable in workspace-write mode");
ABSL_FLAG(bool, exclude_slash_tmp, false,
          "Do not make /tmp writable in workspace-write mode");
ABSL_FLAG(int64_t, timeout_ms, -1, "Kill the command after this long");
ABSL_FLAG(std::string, linux_sandbox_exe, "",
          "Sandbox helper, defaults to the one next to this executable");
ABSL_FLAG(bool, no_sandbox, false, "Run the command without any restriction");
ABSL_FLAG(std::vector<std::string>, log_files, std::vector<std::string>(),
          "File paths to write logs to");
ABSL_FLAG(bool, verbose_stderr, false, "Write debug messages to stderr");

namespace shellbox::linux_sandbox {
namespace {

constexpr int kSetupFailureExitCode = 1;

absl::StatusOr<SandboxPolicy> PolicyFromFlags() {
  std::string mode = absl::GetFlag(FLAGS_mode);
  if (mode == ModeName(SandboxPolicy::Mode::kReadOnly)) {
    return SandboxPolicy::ReadOnly();
  } else if (mode == ModeName(SandboxPolicy::Mode::kDangerFullAccess)) {
    return SandboxPolicy::DangerFullAccess();
  } else if (mode == ModeName(SandboxPolicy::Mode::kWorkspaceWrite)) {
    return SandboxPolicy::WorkspaceWrite({
        .writable_roots = absl::GetFlag(FLAGS_writable_roots),
        .network_access = absl::GetFlag(FLAGS_network_access),
        .exclude_tmpdir_env_var = absl::GetFlag(FLAGS_exclude_tmpdir_env_var),
        .exclude_slash_tmp = absl::GetFlag(FLAGS_exclude_slash_tmp),
    });
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("Unknown --mode '%s'", mode));
}

void PrintOutput(const ExecOutput& output) {
  std::cout << output.stdout_text << std::flush;
  std::cerr << output.stderr_text << std::flush;
}

absl::StatusOr<int> SandboxExecMain(int argc, char** argv) {
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  if (absl::GetFlag(FLAGS_verbose_stderr)) {
    absl::SetStderrThreshold(absl::LogSeverity::kInfo);
    absl::SetGlobalVLogLevel(1);
  } else {
    absl::SetStderrThreshold(absl::LogSeverity::kWarning);
  }
  absl::Status logs_status = LogToFiles(absl::GetFlag(FLAGS_log_files));
  if (!logs_status.ok()) {
    return logs_status;
  }

  if (args.size() < 2) {
    std::string err = absl::StrCat("Wanted argv.size() > 1, was ", args.size());
    return absl::InvalidArgumentError(err);
  }
  absl::StatusOr<SandboxPolicy> policy = PolicyFromFlags();
  if (!policy.ok()) {
    return policy.status();
  }
  char cwd[PATH_MAX];
  if (getcwd(cwd, sizeof(cwd)) == nullptr) {
    return absl::ErrnoToStatus(errno, "`getcwd` failed");
  }

  ExecParams params{
      .command = std::vector<std::string>(args.begin() + 1, args.end()),
      .cwd = cwd,
      .env = CurrentEnvironment(),
  };
  if (int64_t timeout_ms = absl::GetFlag(FLAGS_timeout_ms); timeout_ms >= 0) {
    params.timeout_ms = timeout_ms;
  }
  std::optional<std::string> helper;
  if (!absl::GetFlag(FLAGS_linux_sandbox_exe).empty()) {
    helper = absl::GetFlag(FLAGS_linux_sandbox_exe);
  }
  SandboxType sandbox_type = absl::GetFlag(FLAGS_no_sandbox)
                                 ? SandboxType::kNone
                                 : SandboxType::kLinuxSeccomp;

  VLOG(1) << "Running under " << *policy;
  absl::StatusOr<ExecOutput> result = ProcessExecToolCall(
      std::move(params), sandbox_type, *policy, cwd, std::move(helper));
  if (result.ok()) {
    PrintOutput(*result);
    VLOG(1) << *result;
    return result->exit_code;
  }

  SandboxErrorKind kind = ErrorKindOf(result.status());
  std::optional<ExecOutput> captured = CapturedOutput(result.status());
  if (captured.has_value()) {
    PrintOutput(*captured);
  }
  LOG(WARNING) << ErrorKindName(kind) << ": " << result.status().message();
  switch (kind) {
    case SandboxErrorKind::kDenied:
    case SandboxErrorKind::kTimeout:
    case SandboxErrorKind::kCancelled:
      return captured.has_value() ? captured->exit_code : kSetupFailureExitCode;
    case SandboxErrorKind::kSetupFailure:
      return kSetupFailureExitCode;
    case SandboxErrorKind::kOther:
      break;
  }
  return result.status();
}

}  // namespace
}  // namespace shellbox::linux_sandbox

int main(int argc, char** argv) {
  auto exit_code = shellbox::linux_sandbox::SandboxExecMain(argc, argv);
  if (exit_code.ok()) {
    return *exit_code;
  }
  LOG(ERROR) << exit_code.status().ToString();
  return exit_code.status().raw_code();
}
