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

#include <dirent.h>
#include <fcntl.h>
#include <linux/landlock.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cstdint>
#include <ios>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "host/libs/sandbox/filesystem.h"
#include "host/libs/sandbox/reserved_mounts.h"
#include "host/libs/sandbox/rule_resolver.h"
#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

constexpr char kDevNull[] = "/dev/null";

constexpr std::uint64_t kAccessRead = LANDLOCK_ACCESS_FS_EXECUTE |
                                      LANDLOCK_ACCESS_FS_READ_FILE |
                                      LANDLOCK_ACCESS_FS_READ_DIR;

// Every right of the first Landlock ABI that modifies the filesystem.
constexpr std::uint64_t kAccessWriteV1 =
    LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_FILE | LANDLOCK_ACCESS_FS_MAKE_CHAR |
    LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO |
    LANDLOCK_ACCESS_FS_MAKE_BLOCK | LANDLOCK_ACCESS_FS_MAKE_SYM;

// Rights that may be attached to a rule on a non-directory.
constexpr std::uint64_t kAccessFile = LANDLOCK_ACCESS_FS_EXECUTE |
                                      LANDLOCK_ACCESS_FS_WRITE_FILE |
                                      LANDLOCK_ACCESS_FS_READ_FILE;

std::uint64_t TruncateAccess(int abi) {
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
  if (abi >= 3) {
    return LANDLOCK_ACCESS_FS_TRUNCATE;
  }
#endif
  (void)abi;
  return 0;
}

std::uint64_t HandledAccessForAbi(int abi) {
  std::uint64_t access = kAccessRead | kAccessWriteV1;
  if (abi >= 2) {
    access |= LANDLOCK_ACCESS_FS_REFER;
  }
  return access | TruncateAccess(abi);
}

std::uint64_t FileAccessForAbi(int abi) {
  return kAccessFile | TruncateAccess(abi);
}

int CreateRuleset(const landlock_ruleset_attr* attr, size_t size,
                  std::uint32_t flags) {
  return syscall(__NR_landlock_create_ruleset, attr, size, flags);
}

bool ContainsProtected(const std::string& path,
                       const std::set<std::string>& protected_paths) {
  for (const auto& protected_path : protected_paths) {
    if (IsPathWithin(protected_path, path)) {
      return true;
    }
  }
  return false;
}

/* Grants write access beneath `path` without covering anything in
 * `protected_paths`, descending into directories that hold a protected path. */
absl::Status AllowWriteAvoiding(LandlockRuleset& ruleset,
                                const std::string& path,
                                const std::set<std::string>& protected_paths) {
  if (protected_paths.count(path)) {
    VLOG(1) << "Leaving '" << path << "' read-only";
    return absl::OkStatus();
  }
  if (!ContainsProtected(path, protected_paths)) {
    absl::Status status = ruleset.AllowReadWrite(path);
    if (absl::IsNotFound(status)) {
      VLOG(1) << "Skipping missing path '" << path << "'";
      return absl::OkStatus();
    }
    return status;
  }

  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  if (dir.get() == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`opendir(", path, ")` failed"));
  }
  while (dirent* ent = readdir(dir.get())) {
    // `d_name` is guaranteed to be null terminated
    std::string_view name = ent->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    std::string child = JoinPath(path, name);
    struct stat stat_buf;
    if (lstat(child.c_str(), &stat_buf) < 0) {
      return absl::ErrnoToStatus(errno, absl::StrCat("`lstat` failed: ", child));
    }
    // A rule on a symlink would grant its target, which may be anywhere.
    if (S_ISLNK(stat_buf.st_mode)) {
      VLOG(1) << "Not following symlink '" << child << "'";
      continue;
    }
    absl::Status status = AllowWriteAvoiding(ruleset, child, protected_paths);
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<int> LandlockAbiVersion() {
  int abi = CreateRuleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
  if (abi < 0) {
    return absl::ErrnoToStatus(errno, "Landlock is unavailable");
  }
  return abi;
}

LandlockRuleset::LandlockRuleset(UniqueFd fd, int abi,
                                 std::uint64_t handled_access)
    : fd_(std::move(fd)), abi_(abi), handled_access_(handled_access) {}

absl::StatusOr<LandlockRuleset> LandlockRuleset::Create() {
  absl::StatusOr<int> abi = LandlockAbiVersion();
  if (!abi.ok()) {
    return abi.status();
  }
  std::uint64_t handled_access = HandledAccessForAbi(*abi);
  landlock_ruleset_attr attr = {
      .handled_access_fs = handled_access,
  };
  UniqueFd fd(CreateRuleset(&attr, sizeof(attr), 0));
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`landlock_create_ruleset` failed");
  }
  VLOG(1) << "Landlock ABI " << *abi << ", handled access 0x" << std::hex
          << handled_access;
  return LandlockRuleset(std::move(fd), *abi, handled_access);
}

absl::Status LandlockRuleset::AllowRead(const std::string& path) {
  return AddPathBeneath(path, kAccessRead);
}

absl::Status LandlockRuleset::AllowReadWrite(const std::string& path) {
  return AddPathBeneath(path, handled_access_);
}

absl::Status LandlockRuleset::AddPathBeneath(const std::string& path,
                                             std::uint64_t access) {
  UniqueFd parent(open(path.c_str(), O_PATH | O_CLOEXEC));
  if (parent.Get() < 0) {
    auto error = absl::StrFormat("`open(\"%s\", O_PATH)` failed", path);
    return absl::ErrnoToStatus(errno, error);
  }
  struct stat stat_buf;
  if (fstat(parent.Get(), &stat_buf) < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`fstat` failed: ", path));
  }
  if (!S_ISDIR(stat_buf.st_mode)) {
    access &= FileAccessForAbi(abi_);
  }
  landlock_path_beneath_attr path_beneath = {
      .allowed_access = access & handled_access_,
      .parent_fd = parent.Get(),
  };
  if (syscall(__NR_landlock_add_rule, fd_.Get(), LANDLOCK_RULE_PATH_BENEATH,
              &path_beneath, 0) < 0) {
    auto error = absl::StrFormat("`landlock_add_rule(\"%s\")` failed", path);
    return absl::ErrnoToStatus(errno, error);
  }
  VLOG(1) << "Landlock rule 0x" << std::hex << path_beneath.allowed_access
          << " for '" << path << "'";
  return absl::OkStatus();
}

absl::Status RestrictSelf(LandlockRuleset ruleset) {
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    return absl::ErrnoToStatus(errno, "`prctl(PR_SET_NO_NEW_PRIVS)` failed");
  }
  if (syscall(__NR_landlock_restrict_self, ruleset.fd_.Get(), 0) < 0) {
    return absl::ErrnoToStatus(errno, "`landlock_restrict_self` failed");
  }
  return absl::OkStatus();
}

absl::Status ApplyFilesystemRules(const ResolvedRules& rules,
                                  const ReservedProtection& protection) {
  if (rules.full_disk_write) {
    return absl::OkStatus();
  }
  absl::StatusOr<LandlockRuleset> ruleset = LandlockRuleset::Create();
  if (!ruleset.ok()) {
    return ruleset.status();
  }
  if (absl::Status read = ruleset->AllowRead("/"); !read.ok()) {
    return read;
  }
  if (absl::Status dev_null = ruleset->AllowReadWrite(kDevNull);
      !dev_null.ok()) {
    return dev_null;
  }

  std::set<std::string> split_around;
  if (protection.method == ReservedProtection::Method::kSplitGrants) {
    split_around = protection.paths;
  }
  for (const auto& path : rules.writable) {
    absl::Status status = AllowWriteAvoiding(*ruleset, path, split_around);
    if (!status.ok()) {
      return status;
    }
  }
  return RestrictSelf(std::move(*ruleset));
}

}  // namespace linux_sandbox
}  // namespace shellbox
