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
#include "host/libs/sandbox/exec_error.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <json/json.h>

namespace shellbox {
namespace linux_sandbox {
namespace {

constexpr char kKindPayloadUrl[] = "type.shellbox/linux_sandbox.ErrorKind";
constexpr char kOutputPayloadUrl[] = "type.shellbox/linux_sandbox.ExecOutput";

constexpr SandboxErrorKind kAllKinds[] = {
    SandboxErrorKind::kDenied,
    SandboxErrorKind::kTimeout,
    SandboxErrorKind::kCancelled,
    SandboxErrorKind::kSetupFailure,
};

std::string EncodeOutput(const ExecOutput& output) {
  Json::Value root(Json::objectValue);
  root["exit_code"] = output.exit_code;
  root["stdout"] = output.stdout_text;
  root["stderr"] = output.stderr_text;
  root["duration_us"] =
      static_cast<Json::Int64>(absl::ToInt64Microseconds(output.duration));
  root["timed_out"] = output.timed_out;
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

std::optional<ExecOutput> DecodeOutput(const std::string& encoded) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(encoded.data(), encoded.data() + encoded.size(), &root,
                     &errors)) {
    LOG(ERROR) << "Malformed ExecOutput payload: " << errors;
    return std::nullopt;
  }
  ExecOutput output;
  output.exit_code = root["exit_code"].asInt();
  output.stdout_text = root["stdout"].asString();
  output.stderr_text = root["stderr"].asString();
  output.duration = absl::Microseconds(root["duration_us"].asInt64());
  output.timed_out = root["timed_out"].asBool();
  return output;
}

absl::Status Tagged(absl::StatusCode code, std::string_view message,
                    SandboxErrorKind kind, const ExecOutput* output) {
  absl::Status status(code, message);
  status.SetPayload(kKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  if (output) {
    status.SetPayload(kOutputPayloadUrl, absl::Cord(EncodeOutput(*output)));
  }
  return status;
}

}  // namespace

std::ostream& operator<<(std::ostream& out, const ExecOutput& output) {
  out << "ExecOutput {\n";
  out << "\texit_code: " << output.exit_code << "\n";
  out << "\tstdout: \"" << output.stdout_text << "\"\n";
  out << "\tstderr: \"" << output.stderr_text << "\"\n";
  out << "\tduration: " << output.duration << "\n";
  out << "\ttimed_out: " << output.timed_out << "\n";
  return out << "}";
}

std::string_view ErrorKindName(SandboxErrorKind kind) {
  switch (kind) {
    case SandboxErrorKind::kOther:
      return "other";
    case SandboxErrorKind::kDenied:
      return "denied";
    case SandboxErrorKind::kTimeout:
      return "timeout";
    case SandboxErrorKind::kCancelled:
      return "cancelled";
    case SandboxErrorKind::kSetupFailure:
      return "setup_failure";
  }
  return "other";
}

absl::Status DeniedError(ExecOutput output) {
  auto message = absl::StrCat("Sandbox denied command (exit code ",
                              output.exit_code, ")");
  return Tagged(absl::StatusCode::kPermissionDenied, message,
                SandboxErrorKind::kDenied, &output);
}

absl::Status TimeoutError(ExecOutput output) {
  auto message = absl::StrCat("Command timed out after ",
                              absl::FormatDuration(output.duration));
  return Tagged(absl::StatusCode::kDeadlineExceeded, message,
                SandboxErrorKind::kTimeout, &output);
}

absl::Status CancelledError(ExecOutput output) {
  return Tagged(absl::StatusCode::kCancelled, "Command cancelled",
                SandboxErrorKind::kCancelled, &output);
}

absl::Status SetupFailureError(std::string_view message) {
  return Tagged(absl::StatusCode::kFailedPrecondition, message,
                SandboxErrorKind::kSetupFailure, nullptr);
}

absl::Status SetupFailureError(const absl::Status& cause) {
  return SetupFailureError(cause.ToString());
}

SandboxErrorKind ErrorKindOf(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kKindPayloadUrl);
  if (!payload) {
    return SandboxErrorKind::kOther;
  }
  for (SandboxErrorKind kind : kAllKinds) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return SandboxErrorKind::kOther;
}

std::optional<ExecOutput> CapturedOutput(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kOutputPayloadUrl);
  if (!payload) {
    return std::nullopt;
  }
  return DecodeOutput(std::string(*payload));
}

}  // namespace linux_sandbox
}  // namespace shellbox
