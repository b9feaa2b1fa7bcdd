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
#include "host/libs/sandbox/filesystem.h"

#include <gtest/gtest.h>

namespace shellbox::linux_sandbox {

TEST(FilesystemTest, JoinPath) {
  EXPECT_EQ(JoinPath("/a", "b"), "/a/b");
  EXPECT_EQ(JoinPath("/a/", "/b"), "/a/b");
  EXPECT_EQ(JoinPath("", "b"), "b");
  EXPECT_EQ(JoinPath("/", ".git"), "/.git");
}

TEST(FilesystemTest, CleanPath) {
  EXPECT_EQ(CleanPath("/a//b/./c/"), "/a/b/c");
  EXPECT_EQ(CleanPath("/a/b/../c"), "/a/c");
  EXPECT_EQ(CleanPath("/../.."), "/");
  EXPECT_EQ(CleanPath("a/../../b"), "../b");
  EXPECT_EQ(CleanPath(""), ".");
}

TEST(FilesystemTest, Dirname) {
  EXPECT_EQ(Dirname("/a/b"), "/a");
  EXPECT_EQ(Dirname("/a"), "/");
  EXPECT_EQ(Dirname("a"), "");
}

TEST(FilesystemTest, IsPathWithin) {
  EXPECT_TRUE(IsPathWithin("/repo", "/repo"));
  EXPECT_TRUE(IsPathWithin("/repo/.git/config", "/repo/.git"));
  EXPECT_TRUE(IsPathWithin("/anything", "/"));
  EXPECT_FALSE(IsPathWithin("/repository", "/repo"));
  EXPECT_FALSE(IsPathWithin("/re", "/repo"));
}

}  // namespace shellbox::linux_sandbox
