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
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "ioharness/model/model.pb.h"
#include "ioharness/model/schema.pb.h"

namespace ioharness {

using model::Kind;

/// Returns the message type declared for `kind` through the `node` option, or
/// null if no message type declares it.
const google::protobuf::Descriptor* KindDescriptor(Kind kind);

/// Returns the kind declared by a message type, or KIND_UNSPECIFIED.
Kind KindOf(const google::protobuf::Descriptor* descriptor);

inline Kind KindOf(const google::protobuf::Message& message) {
  return KindOf(message.GetDescriptor());
}

/// Lower case name of the message type, e.g. "block" or "analogsignal". Entry
/// points of drivers are registered under these names.
std::string KindName(Kind kind);

/// Block and Segment are the container roots eligible for generic round trips.
inline bool IsContainerRoot(Kind kind) {
  return kind == model::KIND_BLOCK || kind == model::KIND_SEGMENT;
}

/// Creates an empty message of the given kind.
absl::StatusOr<std::unique_ptr<google::protobuf::Message>> NewObject(Kind kind);

/// Deep copies a message.
std::unique_ptr<google::protobuf::Message> CloneObject(const google::protobuf::Message& message);

/// Fields annotated as payload, in declaration order.
std::vector<const google::protobuf::FieldDescriptor*> PayloadFields(
    const google::protobuf::Descriptor* descriptor);

/// The LazyInfo field of a payload-bearing message type, or null.
const google::protobuf::FieldDescriptor* LazyInfoField(const google::protobuf::Descriptor* descriptor);

/// Message-typed child fields to descend into when walking a tree. Map fields
/// and LazyInfo are excluded.
std::vector<const google::protobuf::FieldDescriptor*> ChildFields(
    const google::protobuf::Descriptor* descriptor);

} // namespace ioharness
