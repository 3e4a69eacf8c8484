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

#include "ioharness/kind.h"

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace ioharness {
namespace {

const absl::flat_hash_map<Kind, const google::protobuf::Descriptor*>& KindRegistry() {
  // Built once; function local statics are initialized exactly once, even
  // when first used concurrently.
  static const auto* registry = [] {
    auto* result = new absl::flat_hash_map<Kind, const google::protobuf::Descriptor*>();
    const google::protobuf::FileDescriptor* file = model::Block::descriptor()->file();
    for (int i = 0; i < file->message_type_count(); i++) {
      const google::protobuf::Descriptor* desc = file->message_type(i);
      Kind kind = KindOf(desc);
      if (kind != model::KIND_UNSPECIFIED) {
        result->emplace(kind, desc);
      }
    }
    return result;
  }();
  return *registry;
}

} // namespace

const google::protobuf::Descriptor* KindDescriptor(Kind kind) {
  const auto& registry = KindRegistry();
  auto iter = registry.find(kind);
  if (iter == registry.end()) {
    return nullptr;
  }
  return iter->second;
}

Kind KindOf(const google::protobuf::Descriptor* descriptor) {
  if (descriptor == nullptr || !descriptor->options().HasExtension(model::node)) {
    return model::KIND_UNSPECIFIED;
  }
  return descriptor->options().GetExtension(model::node).kind();
}

std::string KindName(Kind kind) {
  const auto* desc = KindDescriptor(kind);
  if (desc == nullptr) {
    return absl::AsciiStrToLower(model::Kind_Name(kind));
  }
  return absl::AsciiStrToLower(desc->name());
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> NewObject(Kind kind) {
  const auto* desc = KindDescriptor(kind);
  if (desc == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("no message type declared for kind ", model::Kind_Name(kind)));
  }
  const auto* prototype = google::protobuf::MessageFactory::generated_factory()->GetPrototype(desc);
  if (prototype == nullptr) {
    return absl::InternalError(absl::StrCat("no prototype for ", desc->full_name()));
  }
  return std::unique_ptr<google::protobuf::Message>(prototype->New());
}

std::unique_ptr<google::protobuf::Message> CloneObject(const google::protobuf::Message& message) {
  std::unique_ptr<google::protobuf::Message> result(message.New());
  result->CopyFrom(message);
  return result;
}

std::vector<const google::protobuf::FieldDescriptor*> PayloadFields(
    const google::protobuf::Descriptor* descriptor) {
  std::vector<const google::protobuf::FieldDescriptor*> result;
  for (int i = 0; i < descriptor->field_count(); i++) {
    const auto* field = descriptor->field(i);
    if (field->options().HasExtension(model::field) &&
        field->options().GetExtension(model::field).payload()) {
      result.push_back(field);
    }
  }
  return result;
}

const google::protobuf::FieldDescriptor* LazyInfoField(
    const google::protobuf::Descriptor* descriptor) {
  for (int i = 0; i < descriptor->field_count(); i++) {
    const auto* field = descriptor->field(i);
    if (!field->is_repeated() &&
        field->cpp_type() == google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE &&
        field->message_type() == model::LazyInfo::descriptor()) {
      return field;
    }
  }
  return nullptr;
}

std::vector<const google::protobuf::FieldDescriptor*> ChildFields(
    const google::protobuf::Descriptor* descriptor) {
  std::vector<const google::protobuf::FieldDescriptor*> result;
  for (int i = 0; i < descriptor->field_count(); i++) {
    const auto* field = descriptor->field(i);
    if (field->cpp_type() != google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE ||
        field->is_map() || field->message_type() == model::LazyInfo::descriptor()) {
      continue;
    }
    result.push_back(field);
  }
  return result;
}

} // namespace ioharness
