// Copyright 2023-2025 Buf Technologies, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "ioharness/status.h"

#include <vector>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace ioharness {

absl::Status SkipError(std::string_view reason) {
  absl::Status status = absl::FailedPreconditionError(reason);
  harness::Skip skip;
  *skip.mutable_reason() = reason;
  status.SetPayload(kSkipTypeUrl, absl::Cord(skip.SerializeAsString()));
  return status;
}

bool IsSkip(const absl::Status& status) {
  return status.code() == absl::StatusCode::kFailedPrecondition &&
      status.GetPayload(kSkipTypeUrl).has_value();
}

std::string SkipReason(const absl::Status& status) {
  if (!IsSkip(status)) {
    return "";
  }
  harness::Skip skip;
  if (!skip.ParseFromString(std::string(*status.GetPayload(kSkipTypeUrl)))) {
    return std::string(status.message());
  }
  return skip.reason();
}

std::optional<harness::FailureContext> GetFailureContext(const absl::Status& status) {
  auto payload = status.GetPayload(kFailureContextTypeUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  harness::FailureContext context;
  if (!context.ParseFromString(std::string(*payload))) {
    return std::nullopt;
  }
  return context;
}

std::string DescribeContext(const harness::FailureContext& context) {
  std::vector<std::string> parts;
  if (!context.scenario().empty()) {
    parts.push_back(absl::StrCat("in ", context.scenario()));
  }
  if (!context.object().empty()) {
    parts.push_back(absl::StrCat("for ", context.object(), " object"));
  }
  if (!context.fixture().empty()) {
    parts.push_back(absl::StrCat(
        "from ",
        context.fixture(),
        " with lazy=",
        context.lazy() ? "true" : "false",
        " read_all=",
        context.read_all() ? "true" : "false"));
  }
  if (context.tolerance() != 0) {
    parts.push_back(absl::StrCat("at tolerance ", context.tolerance()));
  }
  return absl::StrJoin(parts, " ");
}

absl::Status AnnotateFailure(const absl::Status& status, const harness::FailureContext& context) {
  if (status.ok() || IsSkip(status)) {
    return status;
  }
  harness::FailureContext merged = context;
  if (auto inner = GetFailureContext(status); inner.has_value()) {
    merged.MergeFrom(*inner);
  }
  std::string message(status.message());
  if (std::string description = DescribeContext(context); !description.empty()) {
    absl::StrAppend(&message, " (", description, ")");
  }
  absl::Status result(status.code(), message);
  status.ForEachPayload([&result](absl::string_view typeUrl, const absl::Cord& payload) {
    result.SetPayload(typeUrl, payload);
  });
  result.SetPayload(kFailureContextTypeUrl, absl::Cord(merged.SerializeAsString()));
  return result;
}

} // namespace ioharness
