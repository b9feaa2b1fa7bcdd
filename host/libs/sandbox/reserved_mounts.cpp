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
#include "host/libs/sandbox/reserved_mounts.h"

#include <fcntl.h>
#include <limits.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <ostream>
#include <set>
#include <string>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "host/libs/sandbox/rule_resolver.h"
#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {
namespace {

absl::Status WriteProcFile(const std::string& path, const std::string& value) {
  absl::StatusOr<UniqueFd> fd = UniqueFd::Open(path, O_WRONLY);
  if (!fd.ok()) {
    return fd.status();
  }
  ssize_t written = write(fd->Get(), value.data(), value.size());
  if (written < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`write(", path, ")` failed"));
  } else if (static_cast<size_t>(written) != value.size()) {
    return absl::InternalError(absl::StrCat("Short write to ", path));
  }
  return absl::OkStatus();
}

/* Becomes root of a new user namespace mapped onto the current ids, which is
 * enough to create mounts in a new mount namespace without any privileges in
 * the initial one. */
absl::Status EnterMountNamespace() {
  uid_t uid = getuid();
  gid_t gid = getgid();
  if (unshare(CLONE_NEWUSER | CLONE_NEWNS) < 0) {
    return absl::ErrnoToStatus(errno, "`unshare(CLONE_NEWUSER | CLONE_NEWNS)`");
  }
  // Required before an unprivileged process may write `gid_map`.
  if (absl::Status deny = WriteProcFile("/proc/self/setgroups", "deny");
      !deny.ok() && !absl::IsNotFound(deny)) {
    return deny;
  }
  auto uid_map = absl::StrFormat("%u %u 1\n", uid, uid);
  if (absl::Status status = WriteProcFile("/proc/self/uid_map", uid_map);
      !status.ok()) {
    return status;
  }
  auto gid_map = absl::StrFormat("%u %u 1\n", gid, gid);
  if (absl::Status status = WriteProcFile("/proc/self/gid_map", gid_map);
      !status.ok()) {
    return status;
  }
  // Keep the new mounts from propagating back to the parent namespace.
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
    return absl::ErrnoToStatus(errno, "`mount(/, MS_REC | MS_PRIVATE)` failed");
  }
  return absl::OkStatus();
}

/* Flags a remount inside a user namespace must keep, since the kernel locks
 * them on mounts inherited from a more privileged namespace. */
absl::StatusOr<unsigned long> LockedMountFlags(const std::string& path) {
  struct statvfs stat_buf;
  if (statvfs(path.c_str(), &stat_buf) < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`statvfs` failed: ", path));
  }
  unsigned long flags = 0;
  if (stat_buf.f_flag & ST_NOSUID) {
    flags |= MS_NOSUID;
  }
  if (stat_buf.f_flag & ST_NODEV) {
    flags |= MS_NODEV;
  }
  if (stat_buf.f_flag & ST_NOEXEC) {
    flags |= MS_NOEXEC;
  }
  if (stat_buf.f_flag & ST_NOATIME) {
    flags |= MS_NOATIME;
  }
  if (stat_buf.f_flag & ST_NODIRATIME) {
    flags |= MS_NODIRATIME;
  }
  if (stat_buf.f_flag & ST_RELATIME) {
    flags |= MS_RELATIME;
  }
  return flags;
}

absl::Status MountReadOnly(const std::string& path) {
  if (mount(path.c_str(), path.c_str(), nullptr, MS_BIND | MS_REC, nullptr) <
      0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("Bind mount failed: ", path));
  }
  absl::StatusOr<unsigned long> locked = LockedMountFlags(path);
  if (!locked.ok()) {
    return locked.status();
  }
  unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY | *locked;
  if (mount(nullptr, path.c_str(), nullptr, flags, nullptr) < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("Remount failed: ", path));
  }
  VLOG(1) << "Mounted '" << path << "' read-only";
  return absl::OkStatus();
}

/* A working directory inside a freshly mounted path still refers to the
 * writable mount underneath. */
absl::Status ReenterWorkingDirectory() {
  char cwd[PATH_MAX];
  if (getcwd(cwd, sizeof(cwd)) == nullptr) {
    return absl::ErrnoToStatus(errno, "`getcwd` failed");
  }
  if (chdir(cwd) < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`chdir(", cwd, ")` failed"));
  }
  return absl::OkStatus();
}

}  // namespace

std::ostream& operator<<(std::ostream& out, const ReservedProtection& value) {
  switch (value.method) {
    case ReservedProtection::Method::kNone:
      out << "none";
      break;
    case ReservedProtection::Method::kReadOnlyMounts:
      out << "read-only mounts";
      break;
    case ReservedProtection::Method::kSplitGrants:
      out << "split grants";
      break;
  }
  return out << " [" << absl::StrJoin(value.paths, ", ") << "]";
}

absl::StatusOr<ReservedProtection> ProtectReservedPaths(
    const ResolvedRules& rules) {
  ReservedProtection protection;
  if (rules.full_disk_write) {
    return protection;
  }
  for (const auto& path : rules.reserved_readonly) {
    struct stat stat_buf;
    if (lstat(path.c_str(), &stat_buf) == 0) {
      protection.paths.insert(path);
    } else if (errno != ENOENT && errno != ENOTDIR) {
      return absl::ErrnoToStatus(errno, absl::StrCat("`lstat` failed: ", path));
    }
  }
  if (protection.paths.empty()) {
    return protection;
  }

  absl::Status status = EnterMountNamespace();
  for (auto it = protection.paths.begin();
       status.ok() && it != protection.paths.end(); ++it) {
    status = MountReadOnly(*it);
  }
  if (status.ok()) {
    status = ReenterWorkingDirectory();
  }
  if (status.ok()) {
    protection.method = ReservedProtection::Method::kReadOnlyMounts;
  } else {
    LOG(WARNING) << "Falling back to split Landlock grants: " << status;
    protection.method = ReservedProtection::Method::kSplitGrants;
  }
  return protection;
}

}  // namespace linux_sandbox
}  // namespace shellbox
