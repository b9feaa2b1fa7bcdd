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
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "host/libs/sandbox/policy.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

const std::map<std::string, std::string> kNoEnv;

}  // namespace

TEST(RuleResolverTest, ReadOnlyGrantsNothing) {
  ResolvedRules rules =
      ResolveRules(SandboxPolicy::ReadOnly(), "/work", {{"TMPDIR", "/t"}});

  EXPECT_TRUE(rules.writable.empty());
  EXPECT_TRUE(rules.reserved_readonly.empty());
  EXPECT_FALSE(rules.full_disk_write);
  EXPECT_FALSE(rules.network_allowed);
}

TEST(RuleResolverTest, DangerFullAccess) {
  ResolvedRules rules =
      ResolveRules(SandboxPolicy::DangerFullAccess(), "/work", kNoEnv);

  EXPECT_TRUE(rules.full_disk_write);
  EXPECT_TRUE(rules.network_allowed);
}

TEST(RuleResolverTest, WorkspaceWriteAddsCwdAndTempDirs) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .writable_roots = {"/data/"},
  });

  ResolvedRules rules =
      ResolveRules(policy, "/work", {{"TMPDIR", "/var/tmp/agent"}});

  std::set<std::string> expected = {"/data", "/tmp", "/var/tmp/agent",
                                    "/work"};
  EXPECT_EQ(rules.writable, expected);
  EXPECT_FALSE(rules.network_allowed);
}

TEST(RuleResolverTest, RelativeRootsResolveAgainstCwd) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .writable_roots = {"build", "../shared/./cache"},
      .exclude_slash_tmp = true,
  });

  ResolvedRules rules = ResolveRules(policy, "/home/user/work", kNoEnv);

  std::set<std::string> expected = {"/home/user/shared/cache",
                                    "/home/user/work",
                                    "/home/user/work/build"};
  EXPECT_EQ(rules.writable, expected);
}

TEST(RuleResolverTest, ReservedDirectoriesStayReadOnly) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .exclude_tmpdir_env_var = true,
      .exclude_slash_tmp = true,
  });

  ResolvedRules rules = ResolveRules(policy, "/repo", kNoEnv);

  EXPECT_EQ(rules.writable, std::set<std::string>{"/repo"});
  std::set<std::string> reserved = {"/repo/.codex", "/repo/.git"};
  EXPECT_EQ(rules.reserved_readonly, reserved);
}

TEST(RuleResolverTest, RootInsideReservedDirectoryIsDropped) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .writable_roots = {"/repo/.git/hooks", "/repo/.codex"},
      .exclude_slash_tmp = true,
  });

  ResolvedRules rules = ResolveRules(policy, "/repo", kNoEnv);

  EXPECT_EQ(rules.writable, std::set<std::string>{"/repo"});
  EXPECT_TRUE(rules.reserved_readonly.count("/repo/.git"));
  EXPECT_TRUE(rules.reserved_readonly.count("/repo/.codex"));
}

TEST(RuleResolverTest, ExcludedTempDirsAreNotWritable) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .writable_roots = {"/tmp/allowed"},
      .exclude_tmpdir_env_var = true,
      .exclude_slash_tmp = true,
  });

  ResolvedRules rules =
      ResolveRules(policy, "/tmp/allowed", {{"TMPDIR", "/tmp/session"}});

  EXPECT_EQ(rules.writable, std::set<std::string>{"/tmp/allowed"});
  for (const auto& reserved : rules.reserved_readonly) {
    EXPECT_EQ(reserved.rfind("/tmp/allowed/", 0), 0) << reserved;
  }
}

TEST(RuleResolverTest, EmptyTmpdirIsIgnored) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .exclude_slash_tmp = true,
  });

  ResolvedRules rules = ResolveRules(policy, "/work", {{"TMPDIR", ""}});

  EXPECT_EQ(rules.writable, std::set<std::string>{"/work"});
}

TEST(RuleResolverTest, NetworkAccessIsCarried) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .network_access = true,
  });

  EXPECT_TRUE(ResolveRules(policy, "/work", kNoEnv).network_allowed);
}

TEST(RuleResolverTest, Deterministic) {
  SandboxPolicy policy = SandboxPolicy::WorkspaceWrite({
      .writable_roots = {"/b", "/a", "/a/nested", "rel"},
      .exclude_tmpdir_env_var = false,
  });
  std::map<std::string, std::string> env = {{"TMPDIR", "/scratch"},
                                            {"HOME", "/home/user"}};

  ResolvedRules first = ResolveRules(policy, "/work", env);
  ResolvedRules second = ResolveRules(policy, "/work", env);

  EXPECT_EQ(first, second);
}

}  // namespace linux_sandbox
}  // namespace shellbox
