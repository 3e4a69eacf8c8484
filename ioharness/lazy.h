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

#include "absl/status/status.h"
#include "google/protobuf/message.h"
#include "ioharness/driver.h"

namespace ioharness {

/// Checks that every lazy payload node of `lazyObject` records the shape of
/// the node at the same position in `eagerObject`.
///
/// The product of the recorded dimensions must equal the length of the
/// longest payload field of the eager node. The two trees must have the same
/// structure.
absl::Status AssertLazyShapesMatch(
    const google::protobuf::Message& lazyObject, const google::protobuf::Message& eagerObject);

/// Loads every lazy payload node of `lazyObject` through `loader` and checks
/// that the result is structurally equal to the node at the same position in
/// `eagerObject`.
absl::Status AssertLazyObjectsCanBeLoaded(
    const google::protobuf::Message& lazyObject,
    const google::protobuf::Message& eagerObject,
    const LazyLoadFunc& loader,
    double tolerance);

} // namespace ioharness
