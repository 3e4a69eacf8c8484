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

#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "google/protobuf/message.h"
#include "ioharness/kind.h"

namespace ioharness {

/// Generates a minimal compliant object of `kind`.
///
/// Children are generated only for kinds listed in `include`, so a driver is
/// never handed a node type it does not support. The output is deterministic:
/// a Block holds two Segments, and each Segment holds one node of every
/// included leaf kind. An AnalogSignal carries the samples [1.0, 2.0, 3.0].
absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GenerateObject(
    Kind kind, const std::vector<Kind>& include);

/// Generates an object of the highest supported kind populated with every
/// other supported kind.
absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GenerateFromSupportedKinds(
    const std::vector<Kind>& supportedKinds);

} // namespace ioharness
