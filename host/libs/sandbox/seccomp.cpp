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
#include "host/libs/sandbox/seccomp.h"

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <sandboxed_api/sandbox2/util/bpf_helper.h>

namespace shellbox {
namespace linux_sandbox {
namespace {

#if defined(__x86_64__)
constexpr std::uint32_t kNativeAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr std::uint32_t kNativeAuditArch = AUDIT_ARCH_AARCH64;
#else
#error "Unsupported architecture"
#endif

}  // namespace

absl::StatusOr<std::vector<sock_filter>> BuildNetworkFilter() {
  bpf_labels labels = {0};
  std::vector<sock_filter> filter = {
      LOAD_ARCH,
      JNE32(kNativeAuditArch, JUMP(&labels, kill_process)),
      LOAD_SYSCALL_NR,
#ifdef __X32_SYSCALL_BIT
      JGE32(__X32_SYSCALL_BIT, JUMP(&labels, kill_process)),
#endif
      SYSCALL(__NR_socket, JUMP(&labels, check_domain)),
      SYSCALL(__NR_socketpair, JUMP(&labels, check_domain)),
      SYSCALL(__NR_connect, ERRNO(EPERM)),
      SYSCALL(__NR_bind, ERRNO(EPERM)),
      SYSCALL(__NR_listen, ERRNO(EPERM)),
#ifdef __NR_accept
      SYSCALL(__NR_accept, ERRNO(EPERM)),
#endif
      SYSCALL(__NR_accept4, ERRNO(EPERM)),
      // io_uring can create and connect sockets without `socket(2)`.
      SYSCALL(__NR_io_uring_setup, ERRNO(EPERM)),
      SYSCALL(__NR_ptrace, ERRNO(EPERM)),
      SYSCALL(__NR_pidfd_getfd, ERRNO(EPERM)),
      ALLOW,

      LABEL(&labels, check_domain),
      ARG_32(0),
      JEQ32(AF_UNIX, ALLOW),
      ERRNO(EPERM),

      LABEL(&labels, kill_process),
      BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  if (bpf_resolve_jumps(&labels, filter.data(), filter.size()) != 0) {
    return absl::InternalError("Cannot resolve bpf jumps");
  }
  return filter;
}

absl::Status InstallNetworkFilter() {
  absl::StatusOr<std::vector<sock_filter>> filter = BuildNetworkFilter();
  if (!filter.ok()) {
    return filter.status();
  }
  sock_fprog program = {
      .len = static_cast<unsigned short>(filter->size()),
      .filter = filter->data(),
  };
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    return absl::ErrnoToStatus(errno, "`prctl(PR_SET_NO_NEW_PRIVS)` failed");
  }
  if (syscall(__NR_seccomp, SECCOMP_SET_MODE_FILTER, 0, &program) < 0) {
    return absl::ErrnoToStatus(errno, "`seccomp(SECCOMP_SET_MODE_FILTER)`");
  }
  VLOG(1) << "Installed network filter, " << filter->size() << " instructions";
  return absl::OkStatus();
}

}  // namespace linux_sandbox
}  // namespace shellbox
