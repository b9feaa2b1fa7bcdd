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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_LOGS_H
#define SHELLBOX_HOST_LIBS_SANDBOX_LOGS_H

#include <string>
#include <vector>

#include <absl/status/status.h>

namespace shellbox {
namespace linux_sandbox {

/** Mirrors every LOG message into each of `paths` for the rest of the process
 * lifetime. Records are appended and prefixed with `name[pid]`. */
absl::Status LogToFiles(const std::vector<std::string>& paths);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
