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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_FILESYSTEM_H
#define SHELLBOX_HOST_LIBS_SANDBOX_FILESYSTEM_H

#include <initializer_list>
#include <string>
#include <string_view>

namespace shellbox::linux_sandbox {

namespace internal {

std::string JoinPathImpl(std::initializer_list<std::string_view> paths);

}  // namespace internal

template <typename... T>
std::string JoinPath(const T&... args) {
  return internal::JoinPathImpl({std::string_view(args)...});
}

/** Lexically normalizes `path`: collapses repeated separators, removes `.`
 * components and resolves `..` against preceding components. Never consults
 * the filesystem. */
std::string CleanPath(std::string_view path);

/** Everything before the last separator; "/" for top level entries, "" when
 * there is no separator. */
std::string Dirname(std::string_view path);

/** True when `path` is `ancestor` or lies beneath it. Both arguments must
 * already be clean. */
bool IsPathWithin(std::string_view path, std::string_view ancestor);

}  // namespace shellbox::linux_sandbox

#endif
