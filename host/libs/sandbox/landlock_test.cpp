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
#include "host/libs/sandbox/landlock.h"

#include <fcntl.h>
#include <linux/landlock.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <gtest/gtest.h>

#include "host/libs/sandbox/filesystem.h"
#include "host/libs/sandbox/reserved_mounts.h"
#include "host/libs/sandbox/rule_resolver.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

std::string MakeTempDir() {
  std::string path = JoinPath(testing::TempDir(), "landlock_test.XXXXXX");
  if (mkdtemp(path.data()) == nullptr) {
    ADD_FAILURE() << "mkdtemp failed: " << strerror(errno);
  }
  return path;
}

bool CanCreate(const std::string& path) {
  int fd = open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    return false;
  }
  close(fd);
  return true;
}

bool CanRead(const std::string& path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  close(fd);
  return true;
}

class LandlockTest : public testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<int> abi = LandlockAbiVersion();
    if (!abi.ok()) {
      GTEST_SKIP() << "Landlock unavailable: " << abi.status();
    }
    writable_ = MakeTempDir();
    outside_ = MakeTempDir();
  }

  std::string writable_;
  std::string outside_;
};

}  // namespace

TEST_F(LandlockTest, RulesetHandlesWriteAccess) {
  absl::StatusOr<LandlockRuleset> ruleset = LandlockRuleset::Create();

  ASSERT_TRUE(ruleset.ok()) << ruleset.status();
  EXPECT_GE(ruleset->AbiVersion(), 1);
  EXPECT_TRUE(ruleset->HandledAccess() & LANDLOCK_ACCESS_FS_WRITE_FILE);
  EXPECT_TRUE(ruleset->HandledAccess() & LANDLOCK_ACCESS_FS_READ_FILE);
}

TEST_F(LandlockTest, MissingPathIsNotFound) {
  absl::StatusOr<LandlockRuleset> ruleset = LandlockRuleset::Create();
  ASSERT_TRUE(ruleset.ok()) << ruleset.status();

  absl::Status status =
      ruleset->AllowReadWrite(JoinPath(writable_, "does", "not", "exist"));

  EXPECT_TRUE(absl::IsNotFound(status)) << status;
}

TEST_F(LandlockTest, WritesOnlyBeneathWritablePaths) {
  ResolvedRules rules;
  rules.writable = {writable_, JoinPath(writable_, "missing")};

  EXPECT_EXIT(
      {
        if (!ApplyFilesystemRules(rules, ReservedProtection{}).ok()) {
          _exit(1);
        }
        if (!CanCreate(JoinPath(writable_, "file"))) {
          _exit(2);
        }
        if (CanCreate(JoinPath(outside_, "file"))) {
          _exit(3);
        }
        if (!CanCreate("/dev/null")) {
          _exit(4);
        }
        if (!CanRead("/etc/passwd")) {
          _exit(5);
        }
        _exit(0);
      },
      testing::ExitedWithCode(0), "");
}

TEST_F(LandlockTest, FullDiskWriteAppliesNothing) {
  ResolvedRules rules;
  rules.full_disk_write = true;

  EXPECT_EXIT(
      {
        if (!ApplyFilesystemRules(rules, ReservedProtection{}).ok()) {
          _exit(1);
        }
        _exit(CanCreate(JoinPath(outside_, "file")) ? 0 : 2);
      },
      testing::ExitedWithCode(0), "");
}

TEST_F(LandlockTest, SplitGrantsSkipProtectedPaths) {
  std::string git = JoinPath(writable_, ".git");
  ASSERT_EQ(mkdir(git.c_str(), 0755), 0);
  ASSERT_TRUE(CanCreate(JoinPath(git, "HEAD")));
  std::string nested = JoinPath(writable_, "src");
  ASSERT_EQ(mkdir(nested.c_str(), 0755), 0);
  ASSERT_TRUE(CanCreate(JoinPath(writable_, "existing")));

  ResolvedRules rules;
  rules.writable = {writable_};
  rules.reserved_readonly = {git};
  ReservedProtection protection{
      .method = ReservedProtection::Method::kSplitGrants,
      .paths = {git},
  };

  EXPECT_EXIT(
      {
        if (!ApplyFilesystemRules(rules, protection).ok()) {
          _exit(1);
        }
        if (CanCreate(JoinPath(git, "config"))) {
          _exit(2);
        }
        if (!CanRead(JoinPath(git, "HEAD"))) {
          _exit(3);
        }
        if (!CanCreate(JoinPath(nested, "main.c"))) {
          _exit(4);
        }
        if (!CanCreate(JoinPath(writable_, "existing"))) {
          _exit(5);
        }
        _exit(0);
      },
      testing::ExitedWithCode(0), "");
}

}  // namespace linux_sandbox
}  // namespace shellbox
