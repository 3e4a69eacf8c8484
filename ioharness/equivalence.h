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

#include <string>

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace ioharness {

inline constexpr double kDefaultTolerance = 1e-8;

/// Compares two objects field by field.
///
/// Floating point values are equal if they differ by at most `tolerance`.
/// Repeated fields must have the same length and order; maps are compared by
/// key. If `differences` is not null, it receives a description of every
/// difference found.
bool StructurallyEqual(
    const google::protobuf::Message& a,
    const google::protobuf::Message& b,
    double tolerance,
    std::string* differences = nullptr);

/// Returns an Internal error describing the differences if the objects are
/// not structurally equal.
absl::Status AssertStructurallyEqual(
    const google::protobuf::Message& expected,
    const google::protobuf::Message& actual,
    double tolerance);

} // namespace ioharness
