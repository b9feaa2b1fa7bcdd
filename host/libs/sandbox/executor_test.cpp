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

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <gtest/gtest.h>

#include "host/libs/sandbox/exec_error.h"
#include "host/libs/sandbox/filesystem.h"
#include "host/libs/sandbox/outcome.h"
#include "host/libs/sandbox/policy.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

ExecParams ShellParams(const std::string& script) {
  return ExecParams{
      .command = {"/bin/sh", "-c", script},
      .cwd = "/",
      .env = {{"PATH", "/usr/bin:/bin"}},
  };
}

absl::StatusOr<ExecOutput> RunUnsandboxed(
    ExecParams params,
    const SandboxPolicy& policy = SandboxPolicy::DangerFullAccess(),
    const ExecControl* control = nullptr) {
  std::string cwd = params.cwd;
  return ProcessExecToolCall(std::move(params), SandboxType::kNone, policy, cwd,
                             std::nullopt, control);
}

/* Stands in for the sandbox helper: runs `script` with the status pipe on fd 3
 * instead of confining anything. */
std::string WriteFakeHelper(const std::string& script) {
  std::string dir = JoinPath(testing::TempDir(), "executor_test.XXXXXX");
  if (mkdtemp(dir.data()) == nullptr) {
    ADD_FAILURE() << "mkdtemp failed: " << strerror(errno);
  }
  std::string path = JoinPath(dir, "fake_linux_sandbox");
  std::ofstream(path) << "#!/bin/sh\n" << script << "\n";
  EXPECT_EQ(chmod(path.c_str(), 0755), 0) << strerror(errno);
  return path;
}

}  // namespace

TEST(ExecutorTest, CapturesOutputAndExitCode) {
  absl::StatusOr<ExecOutput> result =
      RunUnsandboxed(ShellParams("echo out; echo err >&2; exit 3"));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->stdout_text, "out\n");
  EXPECT_EQ(result->stderr_text, "err\n");
  EXPECT_FALSE(result->timed_out);
  EXPECT_GT(result->duration, absl::ZeroDuration());
}

TEST(ExecutorTest, ResolvesCommandThroughPath) {
  ExecParams params{
      .command = {"echo", "hello"},
      .cwd = "/",
      .env = {{"PATH", "/usr/bin:/bin"}},
  };

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text, "hello\n");
}

TEST(ExecutorTest, UnknownCommandIsNotFound) {
  ExecParams params{
      .command = {"shellbox-no-such-command"},
      .cwd = "/",
      .env = {{"PATH", "/usr/bin:/bin"}},
  };

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  EXPECT_TRUE(absl::IsNotFound(result.status())) << result.status();
}

TEST(ExecutorTest, RunsInWorkingDirectory) {
  std::string dir = JoinPath(testing::TempDir(), "executor_test.XXXXXX");
  ASSERT_NE(mkdtemp(dir.data()), nullptr);
  char real[PATH_MAX];
  ASSERT_NE(realpath(dir.c_str(), real), nullptr);
  ExecParams params = ShellParams("pwd -P");
  params.cwd = real;

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text, std::string(real) + "\n");
}

TEST(ExecutorTest, ExportsNetworkDisabledMarker) {
  const std::string script = "printf %s \"$SHELLBOX_SANDBOX_NETWORK_DISABLED\"";

  absl::StatusOr<ExecOutput> offline =
      RunUnsandboxed(ShellParams(script), SandboxPolicy::ReadOnly());
  absl::StatusOr<ExecOutput> online = RunUnsandboxed(ShellParams(script));

  ASSERT_TRUE(offline.ok()) << offline.status();
  EXPECT_EQ(offline->stdout_text, "1");
  ASSERT_TRUE(online.ok()) << online.status();
  EXPECT_EQ(online->stdout_text, "");
}

TEST(ExecutorTest, StdinIsEmpty) {
  absl::StatusOr<ExecOutput> result = RunUnsandboxed(ShellParams("wc -c"));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text.find_first_not_of(" \n0"), std::string::npos)
      << result->stdout_text;
}

TEST(ExecutorTest, TimeoutKillsCommand) {
  ExecParams params = ShellParams("echo started; sleep 2");
  params.timeout_ms = 50;

  absl::Time start = absl::Now();
  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));
  absl::Duration elapsed = absl::Now() - start;

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kTimeout);
  EXPECT_LT(elapsed, absl::Seconds(1));
  std::optional<ExecOutput> captured = CapturedOutput(result.status());
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->exit_code, kTimeoutExitCode);
  EXPECT_TRUE(captured->timed_out);
}

TEST(ExecutorTest, TimeoutKillsBackgroundedChildren) {
  // The backgrounded sleep keeps stdout open; it must die with the shell.
  ExecParams params = ShellParams("sleep 30 & sleep 30");
  params.timeout_ms = 100;

  absl::Time start = absl::Now();
  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kTimeout);
  EXPECT_LT(absl::Now() - start, kIoDrainTimeout);
}

TEST(ExecutorTest, CancelStopsCommand) {
  absl::StatusOr<ExecControl> control = ExecControl::Create();
  ASSERT_TRUE(control.ok()) << control.status();
  ASSERT_TRUE(control->Cancel().ok());

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(
      ShellParams("sleep 30"), SandboxPolicy::DangerFullAccess(), &*control);

  EXPECT_TRUE(absl::IsCancelled(result.status())) << result.status();
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kCancelled);
}

TEST(ExecutorTest, CancelRequestIsConsumed) {
  absl::StatusOr<ExecControl> control = ExecControl::Create();
  ASSERT_TRUE(control.ok()) << control.status();
  ASSERT_TRUE(control->Cancel().ok());

  absl::StatusOr<ExecOutput> cancelled = RunUnsandboxed(
      ShellParams("sleep 30"), SandboxPolicy::DangerFullAccess(), &*control);
  absl::StatusOr<ExecOutput> next = RunUnsandboxed(
      ShellParams("exit 4"), SandboxPolicy::DangerFullAccess(), &*control);

  EXPECT_EQ(ErrorKindOf(cancelled.status()), SandboxErrorKind::kCancelled);
  ASSERT_TRUE(next.ok()) << next.status();
  EXPECT_EQ(next->exit_code, 4);
}

TEST(ExecutorTest, HugeTimeoutDoesNotExpire) {
  ExecParams params = ShellParams("echo done");
  params.timeout_ms = std::numeric_limits<std::uint64_t>::max();

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text, "done\n");
}

TEST(ExecutorTest, OutputIsTruncated) {
  ExecParams params = ShellParams("head -c 100 /dev/zero | tr '\\0' a");
  params.max_output_bytes = 10;

  absl::StatusOr<ExecOutput> result = RunUnsandboxed(std::move(params));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text.substr(0, 11), "aaaaaaaaaa\n");
  EXPECT_NE(result->stdout_text.find("90 bytes"), std::string::npos)
      << result->stdout_text;
}

TEST(ExecutorTest, InvalidUtf8IsReplaced) {
  absl::StatusOr<ExecOutput> result =
      RunUnsandboxed(ShellParams("printf '\\377ok'"));

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->stdout_text, "\xEF\xBF\xBDok");
}

TEST(ExecutorTest, MissingHelperIsSetupFailure) {
  absl::StatusOr<ExecOutput> result = ProcessExecToolCall(
      ShellParams("true"), SandboxType::kLinuxSeccomp,
      SandboxPolicy::ReadOnly(), "/", "/nonexistent/shellbox_linux_sandbox");

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kSetupFailure);
}

TEST(ExecutorTest, HelperSetupErrorIsSetupFailure) {
  std::string helper = WriteFakeHelper("printf 'policy rejected' >&3\nexit 1");

  absl::StatusOr<ExecOutput> result =
      ProcessExecToolCall(ShellParams("true"), SandboxType::kLinuxSeccomp,
                          SandboxPolicy::ReadOnly(), "/", helper);

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kSetupFailure);
  EXPECT_EQ(result.status().message(), "policy rejected");
}

TEST(ExecutorTest, TimeoutWinsOverSetupErrorOfHungHelper) {
  std::string helper = WriteFakeHelper("printf 'stuck' >&3\nexec sleep 30");
  ExecParams params = ShellParams("true");
  params.timeout_ms = 200;

  absl::StatusOr<ExecOutput> result =
      ProcessExecToolCall(std::move(params), SandboxType::kLinuxSeccomp,
                          SandboxPolicy::ReadOnly(), "/", helper);

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kTimeout)
      << result.status();
}

TEST(ExecutorTest, CurrentEnvironmentMatchesProcess) {
  ASSERT_EQ(setenv("SHELLBOX_EXECUTOR_TEST", "a=b", 1), 0);

  std::map<std::string, std::string> env = CurrentEnvironment();

  EXPECT_EQ(env["SHELLBOX_EXECUTOR_TEST"], "a=b");
  ASSERT_EQ(unsetenv("SHELLBOX_EXECUTOR_TEST"), 0);
}

TEST(ExecutorTest, EmptyCommandIsRejected) {
  ExecParams params = ShellParams("true");
  params.command.clear();

  EXPECT_TRUE(absl::IsInvalidArgument(RunUnsandboxed(params).status()));
}

TEST(DecodeUtf8LossyTest, KeepsValidText) {
  EXPECT_EQ(DecodeUtf8Lossy("plain"), "plain");
  EXPECT_EQ(DecodeUtf8Lossy("caf\xC3\xA9 \xF0\x9F\x99\x82"),
            "caf\xC3\xA9 \xF0\x9F\x99\x82");
}

TEST(DecodeUtf8LossyTest, ReplacesInvalidSequences) {
  // Lone continuation byte, overlong encoding, surrogate, truncated sequence.
  EXPECT_EQ(DecodeUtf8Lossy("a\x80z"), "a\xEF\xBF\xBDz");
  EXPECT_EQ(DecodeUtf8Lossy("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(DecodeUtf8Lossy("\xED\xA0\x80"),
            "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(DecodeUtf8Lossy("\xE2\x82"), "\xEF\xBF\xBD");
}

}  // namespace linux_sandbox
}  // namespace shellbox
