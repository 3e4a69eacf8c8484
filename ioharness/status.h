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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "ioharness/harness/harness.pb.h"

namespace ioharness {

inline constexpr std::string_view kSkipTypeUrl = "type.googleapis.com/ioharness.harness.Skip";
inline constexpr std::string_view kFailureContextTypeUrl =
    "type.googleapis.com/ioharness.harness.FailureContext";

/// Returns a status that marks a scenario as inapplicable.
///
/// Skips are never failures: the scenario did not run because a capability,
/// a declared feature or the network is missing.
absl::Status SkipError(std::string_view reason);

/// Returns true if the status was created by SkipError.
[[nodiscard]] bool IsSkip(const absl::Status& status);

/// Returns the skip reason, or an empty string if the status is not a skip.
std::string SkipReason(const absl::Status& status);

/// Attaches `context` to a failing status.
///
/// The original code, message and payloads are kept. The context is appended
/// to the message and stored as a FailureContext payload; fields already set
/// by an inner annotation take precedence. OK and skip statuses are returned
/// unchanged.
absl::Status AnnotateFailure(const absl::Status& status, const harness::FailureContext& context);

/// Returns the FailureContext attached to the status, if any.
std::optional<harness::FailureContext> GetFailureContext(const absl::Status& status);

/// Formats a context as "from <fixture> with lazy=<bool> ...".
std::string DescribeContext(const harness::FailureContext& context);

} // namespace ioharness
