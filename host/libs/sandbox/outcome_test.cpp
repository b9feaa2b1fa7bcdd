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
#include "host/libs/sandbox/outcome.h"

#include <signal.h>

#include <optional>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <gtest/gtest.h>

#include "host/libs/sandbox/exec_error.h"

namespace shellbox {
namespace linux_sandbox {

TEST(ClassifyOutcomeTest, NonZeroExitIsNotAnError) {
  absl::StatusOr<ExecOutput> result =
      ClassifyOutcome(RawExitStatus::Exited(1), ExecOutput{.stderr_text = "no"},
                      false, SandboxType::kLinuxSeccomp);

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, 1);
  EXPECT_EQ(result->stderr_text, "no");
}

TEST(ClassifyOutcomeTest, ZeroExit) {
  absl::StatusOr<ExecOutput> result = ClassifyOutcome(
      RawExitStatus::Exited(0), ExecOutput{}, false, SandboxType::kNone);

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, 0);
}

TEST(ClassifyOutcomeTest, TimeoutWinsOverExitStatus) {
  absl::StatusOr<ExecOutput> result =
      ClassifyOutcome(RawExitStatus::Killed(SIGKILL),
                      ExecOutput{.stdout_text = "started"}, true,
                      SandboxType::kLinuxSeccomp);

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kTimeout);
  std::optional<ExecOutput> captured = CapturedOutput(result.status());
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(captured->exit_code, kTimeoutExitCode);
  EXPECT_EQ(captured->stdout_text, "started");
  EXPECT_TRUE(captured->timed_out);
}

TEST(ClassifyOutcomeTest, SigsysUnderSandboxIsDenied) {
  absl::StatusOr<ExecOutput> result =
      ClassifyOutcome(RawExitStatus::Killed(SIGSYS), ExecOutput{}, false,
                      SandboxType::kLinuxSeccomp);

  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(absl::IsPermissionDenied(result.status()));
  EXPECT_EQ(ErrorKindOf(result.status()), SandboxErrorKind::kDenied);
  EXPECT_EQ(CapturedOutput(result.status())->exit_code,
            kSignalExitCodeBase + SIGSYS);
}

TEST(ClassifyOutcomeTest, SigsysWithoutSandboxIsOrdinary) {
  absl::StatusOr<ExecOutput> result = ClassifyOutcome(
      RawExitStatus::Killed(SIGSYS), ExecOutput{}, false, SandboxType::kNone);

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, kSignalExitCodeBase + SIGSYS);
}

TEST(ClassifyOutcomeTest, OtherSignalsAreOrdinary) {
  absl::StatusOr<ExecOutput> result =
      ClassifyOutcome(RawExitStatus::Killed(SIGSEGV), ExecOutput{}, false,
                      SandboxType::kLinuxSeccomp);

  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, kSignalExitCodeBase + SIGSEGV);
}

TEST(ClassifyOutcomeTest, CoreDumpCountsAsSignal) {
  RawExitStatus raw{.code = CLD_DUMPED, .status = SIGABRT};

  absl::StatusOr<ExecOutput> result = ClassifyOutcome(
      raw, ExecOutput{}, false, SandboxType::kLinuxSeccomp);

  EXPECT_TRUE(raw.Signalled());
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->exit_code, kSignalExitCodeBase + SIGABRT);
}

}  // namespace linux_sandbox
}  // namespace shellbox
