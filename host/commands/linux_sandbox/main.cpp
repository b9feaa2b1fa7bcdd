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

#include <fcntl.h>
#include <limits.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "host/libs/sandbox/executor.h"
#include "host/libs/sandbox/logs.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/restrict.h"

ABSL_FLAG(std::string, sandbox_policy, "",
          "Policy to apply before running the command, as JSON");
ABSL_FLAG(std::string, sandbox_policy_cwd, "",
          "Directory the policy is resolved against, defaults to the cwd");
ABSL_FLAG(int, status_fd, -1,
          "Descriptor that receives setup errors, closed on exec");
ABSL_FLAG(std::vector<std::string>, log_files, std::vector<std::string>(),
          "File paths to write logs to");
ABSL_FLAG(bool, verbose_stderr, false, "Write debug messages to stderr");

namespace shellbox::linux_sandbox {
namespace {

constexpr int kSetupFailureExitCode = 1;
constexpr int kExecFailureExitCode = 127;

absl::StatusOr<std::string> PolicyCwd() {
  std::string cwd = absl::GetFlag(FLAGS_sandbox_policy_cwd);
  if (!cwd.empty()) {
    return cwd;
  }
  char buffer[PATH_MAX];
  if (getcwd(buffer, sizeof(buffer)) == nullptr) {
    return absl::ErrnoToStatus(errno, "`getcwd` failed");
  }
  return std::string(buffer);
}

absl::Status Setup(int status_fd) {
  // `dup2` into place dropped FD_CLOEXEC. Restoring it is what tells the
  // parent the command was exec'd.
  if (status_fd >= 0 && fcntl(status_fd, F_SETFD, FD_CLOEXEC) < 0) {
    return absl::ErrnoToStatus(errno, "`fcntl(status_fd, F_SETFD)` failed");
  }
  absl::Status logs_status = LogToFiles(absl::GetFlag(FLAGS_log_files));
  if (!logs_status.ok()) {
    return logs_status;
  }
  absl::StatusOr<SandboxPolicy> policy =
      SandboxPolicy::FromJson(absl::GetFlag(FLAGS_sandbox_policy));
  if (!policy.ok()) {
    return policy.status();
  }
  absl::StatusOr<std::string> cwd = PolicyCwd();
  if (!cwd.ok()) {
    return cwd.status();
  }
  return ApplySandboxPolicy(*policy, *cwd, CurrentEnvironment());
}

void ReportSetupFailure(int status_fd, const absl::Status& status) {
  LOG(ERROR) << "Sandbox setup failed: " << status;
  if (status_fd < 0) {
    return;
  }
  std::string message = status.ToString();
  if (write(status_fd, message.data(), message.size()) < 0) {
    PLOG(ERROR) << "Failed to report setup failure";
  }
}

int LinuxSandboxMain(int argc, char** argv) {
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  // Anything below ERROR would end up in the command's captured stderr.
  if (absl::GetFlag(FLAGS_verbose_stderr)) {
    absl::SetStderrThreshold(absl::LogSeverity::kInfo);
    absl::SetGlobalVLogLevel(1);
  } else {
    absl::SetStderrThreshold(absl::LogSeverity::kError);
  }

  int status_fd = absl::GetFlag(FLAGS_status_fd);
  if (args.size() < 2) {
    auto err = absl::StrCat("Wanted a command after `--`, argv.size() was ",
                            args.size());
    ReportSetupFailure(status_fd, absl::InvalidArgumentError(err));
    return kSetupFailureExitCode;
  }
  if (absl::Status setup = Setup(status_fd); !setup.ok()) {
    ReportSetupFailure(status_fd, setup);
    return kSetupFailureExitCode;
  }

  std::vector<char*> command(args.begin() + 1, args.end());
  command.emplace_back(nullptr);
  execvp(command[0], command.data());

  // Restrictions are in place, the command itself is what failed.
  std::cerr << command[0] << ": " << strerror(errno) << '\n';
  return kExecFailureExitCode;
}

}  // namespace
}  // namespace shellbox::linux_sandbox

int main(int argc, char** argv) {
  return shellbox::linux_sandbox::LinuxSandboxMain(argc, argv);
}
