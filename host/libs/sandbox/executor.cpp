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
#include "host/libs/sandbox/executor.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "host/libs/sandbox/exec_error.h"
#include "host/libs/sandbox/filesystem.h"
#include "host/libs/sandbox/helper_path.h"
#include "host/libs/sandbox/outcome.h"
#include "host/libs/sandbox/pidfd.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/poll_callback.h"
#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

constexpr int kStatusFd = 3;
constexpr char kDefaultPath[] = "/usr/local/bin:/usr/bin:/bin";
constexpr char kReplacementCharacter[] = "\xEF\xBF\xBD";

/* Bytes read from one of the command's output pipes. */
class OutputCapture {
 public:
  explicit OutputCapture(std::size_t limit) : limit_(limit) {}

  void Append(std::string_view data) {
    std::size_t room = limit_ - std::min(limit_, bytes_.size());
    bytes_.append(data.substr(0, room));
    dropped_ += data.size() - std::min(room, data.size());
  }

  std::string Text() const {
    std::string text = DecodeUtf8Lossy(bytes_);
    if (dropped_ > 0) {
      absl::StrAppendFormat(&text, "\n[... %d bytes of output truncated]\n",
                            dropped_);
    }
    return text;
  }

 private:
  std::size_t limit_;
  std::string bytes_;
  std::size_t dropped_ = 0;
};

/* Reads what is available on `fd` into `capture`, and stops watching `fd` at
 * end of file. */
absl::Status ReadAvailable(int fd, OutputCapture& capture, PollCallback& poll) {
  char buffer[16 * 1024];
  ssize_t read_size = read(fd, buffer, sizeof(buffer));
  if (read_size < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return absl::OkStatus();
    }
    return absl::ErrnoToStatus(errno, "`read` from command output failed");
  } else if (read_size == 0) {
    poll.Remove(fd);
  } else {
    capture.Append(std::string_view(buffer, read_size));
  }
  return absl::OkStatus();
}

std::vector<std::string> EnvironmentStrings(
    const std::map<std::string, std::string>& env) {
  std::vector<std::string> env_strings;
  for (const auto& [key, value] : env) {
    env_strings.emplace_back(absl::StrCat(key, "=", value));
  }
  return env_strings;
}

/* `execve` does not search PATH, so bare command names are resolved here, the
 * way a shell would with the command's own PATH. */
absl::StatusOr<std::string> ResolveExecutable(
    const std::string& name, const std::map<std::string, std::string>& env) {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  auto path_it = env.find("PATH");
  std::string_view search_path =
      path_it == env.end() ? kDefaultPath : path_it->second;
  for (std::string_view dir : absl::StrSplit(search_path, ':')) {
    if (dir.empty()) {
      continue;
    }
    std::string candidate = JoinPath(dir, name);
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return absl::NotFoundError(
      absl::StrCat("'", name, "' not found in PATH '", search_path, "'"));
}

absl::StatusOr<std::string> FindHelper(
    const std::optional<std::string>& linux_sandbox_exe) {
  absl::StatusOr<std::string> helper = DefaultLinuxSandboxExe();
  if (linux_sandbox_exe.has_value()) {
    helper = *linux_sandbox_exe;
  }
  if (!helper.ok()) {
    return SetupFailureError(helper.status());
  }
  if (access(helper->c_str(), X_OK) < 0) {
    auto error = absl::StrCat("Sandbox helper '", *helper, "' is unusable");
    return SetupFailureError(absl::ErrnoToStatus(errno, error));
  }
  return helper;
}

/* Kills what is left of the process group. The group id stays reserved while
 * the unreaped leader exists, so this cannot hit an unrelated group. */
void KillProcessGroup(pid_t pgid) {
  if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
    PLOG(WARNING) << "kill(-" << pgid << ", SIGKILL) failed";
  }
}

}  // namespace

absl::StatusOr<ExecControl> ExecControl::Create() {
  UniqueFd event_fd(eventfd(0, EFD_CLOEXEC));
  if (event_fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`eventfd` failed");
  }
  return ExecControl(std::move(event_fd));
}

ExecControl::ExecControl(UniqueFd event_fd) : event_fd_(std::move(event_fd)) {}

absl::Status ExecControl::Cancel() const {
  std::uint64_t one = 1;
  if (write(event_fd_.Get(), &one, sizeof(one)) < 0) {
    return absl::ErrnoToStatus(errno, "`write` to cancellation eventfd failed");
  }
  return absl::OkStatus();
}

std::map<std::string, std::string> CurrentEnvironment() {
  std::map<std::string, std::string> env;
  for (char** entry = environ; *entry != nullptr; entry++) {
    std::string_view variable = *entry;
    auto separator = variable.find('=');
    if (separator != std::string_view::npos) {
      env.emplace(variable.substr(0, separator),
                  variable.substr(separator + 1));
    }
  }
  return env;
}

std::string DecodeUtf8Lossy(std::string_view bytes) {
  std::string text;
  text.reserve(bytes.size());
  std::size_t i = 0;
  while (i < bytes.size()) {
    unsigned char lead = bytes[i];
    if (lead < 0x80) {
      text.push_back(bytes[i]);
      i++;
      continue;
    }
    std::size_t length;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      lower = lead == 0xE0 ? 0xA0 : lower;  // Overlong
      upper = lead == 0xED ? 0x9F : upper;  // Surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      lower = lead == 0xF0 ? 0x90 : lower;  // Overlong
      upper = lead == 0xF4 ? 0x8F : upper;  // Above U+10FFFF
    } else {
      text.append(kReplacementCharacter);
      i++;
      continue;
    }
    std::size_t seen = 1;
    while (seen < length && i + seen < bytes.size()) {
      unsigned char next = bytes[i + seen];
      if (next < lower || next > upper) {
        break;
      }
      lower = 0x80;
      upper = 0xBF;
      seen++;
    }
    if (seen == length) {
      text.append(bytes.substr(i, length));
    } else {
      text.append(kReplacementCharacter);
    }
    i += seen;
  }
  return text;
}

absl::StatusOr<ExecOutput> ProcessExecToolCall(
    ExecParams params, SandboxType sandbox_type, const SandboxPolicy& policy,
    std::string_view sandbox_cwd, std::optional<std::string> linux_sandbox_exe,
    const ExecControl* control) {
  absl::Time start = absl::Now();
  if (params.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  if (params.with_escalated_permissions.value_or(false)) {
    LOG(INFO) << "Escalated permissions requested for '" << params.command[0]
              << "': " << params.justification.value_or("(no justification)");
  }

  if (!policy.HasFullNetworkAccess()) {
    params.env[kNetworkDisabledEnvVar] = "1";
  }
  std::vector<std::string> env = EnvironmentStrings(params.env);

  bool sandboxed = sandbox_type != SandboxType::kNone;
  std::vector<std::string> argv;
  if (sandboxed) {
    absl::StatusOr<std::string> helper = FindHelper(linux_sandbox_exe);
    if (!helper.ok()) {
      return helper.status();
    }
    argv = {
        *helper,
        absl::StrCat("--sandbox_policy=", policy.ToJson()),
        absl::StrCat("--sandbox_policy_cwd=", sandbox_cwd),
        absl::StrCat("--status_fd=", kStatusFd),
        "--",
    };
    argv.insert(argv.end(), params.command.begin(), params.command.end());
  } else {
    absl::StatusOr<std::string> exe =
        ResolveExecutable(params.command[0], params.env);
    if (!exe.ok()) {
      return exe.status();
    }
    argv = params.command;
    argv[0] = *exe;
  }

  absl::StatusOr<UniqueFd> dev_null = UniqueFd::Open("/dev/null", O_RDONLY);
  if (!dev_null.ok()) {
    return dev_null.status();
  }
  absl::StatusOr<std::pair<UniqueFd, UniqueFd>> stdout_pipe = UniqueFd::Pipe();
  if (!stdout_pipe.ok()) {
    return stdout_pipe.status();
  }
  absl::StatusOr<std::pair<UniqueFd, UniqueFd>> stderr_pipe = UniqueFd::Pipe();
  if (!stderr_pipe.ok()) {
    return stderr_pipe.status();
  }
  absl::StatusOr<std::pair<UniqueFd, UniqueFd>> status_pipe = UniqueFd::Pipe();
  if (!status_pipe.ok()) {
    return status_pipe.status();
  }

  std::vector<std::pair<UniqueFd, int>> fds;
  fds.emplace_back(std::move(*dev_null), STDIN_FILENO);
  fds.emplace_back(std::move(stdout_pipe->second), STDOUT_FILENO);
  fds.emplace_back(std::move(stderr_pipe->second), STDERR_FILENO);
  if (sandboxed) {
    fds.emplace_back(std::move(status_pipe->second), kStatusFd);
  } else {
    status_pipe->second.Reset(-1);
  }

  absl::StatusOr<PidFd> child =
      PidFd::LaunchSubprocess(argv, std::move(fds), env, params.cwd);
  if (!child.ok()) {
    return sandboxed ? SetupFailureError(child.status()) : child.status();
  }

  const int stdout_fd = stdout_pipe->first.Get();
  const int stderr_fd = stderr_pipe->first.Get();
  const int status_fd = status_pipe->first.Get();
  OutputCapture stdout_capture(params.max_output_bytes);
  OutputCapture stderr_capture(params.max_output_bytes);
  std::string setup_error;
  bool exited = false;
  bool cancelled = false;
  bool timed_out = false;

  PollCallback poll;
  poll.Add(stdout_fd, [&](short) {
    return ReadAvailable(stdout_fd, stdout_capture, poll);
  });
  poll.Add(stderr_fd, [&](short) {
    return ReadAvailable(stderr_fd, stderr_capture, poll);
  });
  poll.Add(status_fd, [&](short) -> absl::Status {
    char buffer[4096];
    ssize_t read_size = read(status_fd, buffer, sizeof(buffer));
    if (read_size < 0) {
      return errno == EINTR ? absl::OkStatus()
                            : absl::ErrnoToStatus(errno, "`read` failed");
    } else if (read_size == 0) {
      poll.Remove(status_fd);  // Closed on exec
    } else {
      setup_error.append(buffer, read_size);
    }
    return absl::OkStatus();
  });
  poll.Add(child->Get(), [&](short) {
    exited = true;
    return absl::OkStatus();
  });
  if (control) {
    poll.Add(control->Fd(), [&](short) -> absl::Status {
      // Consumes the request so the control can be reused by later calls.
      std::uint64_t requests;
      if (read(control->Fd(), &requests, sizeof(requests)) < 0 &&
          errno != EINTR) {
        return absl::ErrnoToStatus(errno, "`read` from cancellation eventfd");
      }
      cancelled = true;
      return absl::OkStatus();
    });
  }

  absl::Time deadline = absl::InfiniteFuture();
  if (params.timeout_ms.has_value()) {
    std::uint64_t timeout_ms = std::min<std::uint64_t>(
        *params.timeout_ms, std::numeric_limits<std::int64_t>::max());
    // Saturates to InfiniteFuture instead of overflowing.
    deadline = start + absl::Milliseconds(static_cast<std::int64_t>(timeout_ms));
  }
  absl::Status poll_status;
  while (!exited && !cancelled) {
    absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      timed_out = true;
      break;
    }
    poll_status = poll.Poll(remaining);
    if (!poll_status.ok()) {
      break;
    }
  }

  if (!exited) {
    VLOG(1) << child->Pid() << ": "
            << (timed_out ? "Timed out" : "Stopping early");
    if (absl::Status halt = child->HaltHierarchy(); !halt.ok()) {
      LOG(WARNING) << "Failed to halt process tree of " << child->Pid() << ": "
                   << halt;
    }
  }
  KillProcessGroup(child->Pid());
  absl::StatusOr<siginfo_t> info = child->Wait();
  if (!info.ok()) {
    return info.status();
  }
  if (!poll_status.ok()) {
    return poll_status;
  }

  // Descendants outside the process group may still hold the pipes.
  poll.Remove(child->Get());
  if (control) {
    poll.Remove(control->Fd());
  }
  absl::Time drain_deadline = absl::Now() + kIoDrainTimeout;
  while (!poll.Empty()) {
    absl::Duration remaining = drain_deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      LOG(WARNING) << "Output of " << child->Pid() << " still open after "
                   << kIoDrainTimeout << ", discarding the rest";
      break;
    }
    if (absl::Status drain = poll.Poll(remaining); !drain.ok()) {
      return drain;
    }
  }

  ExecOutput output{
      .stdout_text = stdout_capture.Text(),
      .stderr_text = stderr_capture.Text(),
      .duration = absl::Now() - start,
  };
  if (cancelled) {
    output.exit_code = kSignalExitCodeBase + SIGKILL;
    return CancelledError(std::move(output));
  }
  // A helper that reported a setup error but outlived the deadline still
  // counts as timed out.
  if (!setup_error.empty() && !timed_out) {
    return SetupFailureError(setup_error);
  }
  return ClassifyOutcome(RawExitStatus::FromSiginfo(*info), std::move(output),
                         timed_out, sandbox_type);
}

}  // namespace linux_sandbox
}  // namespace shellbox
