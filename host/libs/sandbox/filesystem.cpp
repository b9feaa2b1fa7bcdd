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

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace shellbox::linux_sandbox {
namespace internal {

std::string JoinPathImpl(std::initializer_list<std::string_view> paths) {
  std::string joined;
  for (std::string_view component : paths) {
    if (component.empty()) {
      continue;
    }
    if (!joined.empty()) {
      absl::ConsumePrefix(&component, "/");
      if (joined.back() != '/') {
        joined.push_back('/');
      }
    }
    joined.append(component);
  }
  return joined;
}

}  // namespace internal

std::string CleanPath(std::string_view path) {
  const bool absolute = absl::StartsWith(path, "/");
  std::vector<std::string_view> components;
  // `..` that climbs above the start of a relative path.
  std::size_t leading_parents = 0;
  for (std::string_view component :
       absl::StrSplit(path, '/', absl::SkipEmpty())) {
    if (component == ".") {
      continue;
    }
    if (component != "..") {
      components.push_back(component);
    } else if (!components.empty()) {
      components.pop_back();
    } else if (!absolute) {
      leading_parents++;
    }
  }
  components.insert(components.begin(), leading_parents, "..");
  std::string cleaned = absl::StrJoin(components, "/");
  if (absolute) {
    return absl::StrCat("/", cleaned);
  }
  return cleaned.empty() ? "." : cleaned;
}

std::string Dirname(std::string_view path) {
  const auto last_slash = path.find_last_of('/');
  if (last_slash == std::string::npos) {
    return "";
  }
  if (last_slash == 0) {
    return "/";
  }
  return std::string(path.substr(0, last_slash));
}

bool IsPathWithin(std::string_view path, std::string_view ancestor) {
  if (ancestor == "/") {
    return absl::StartsWith(path, "/");
  }
  if (!absl::StartsWith(path, ancestor)) {
    return false;
  }
  return path.size() == ancestor.size() || path[ancestor.size()] == '/';
}

}  // namespace shellbox::linux_sandbox
