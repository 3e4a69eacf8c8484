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

#include "ioharness/lazy.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "ioharness/equivalence.h"
#include "ioharness/kind.h"

namespace ioharness {
namespace {

using NodeVisitor = std::function<absl::Status(
    const std::string& path,
    const google::protobuf::Message& lazyNode,
    const google::protobuf::Message& eagerNode)>;

std::string JoinPath(const std::string& parent, std::string_view element) {
  return parent.empty() ? std::string(element) : absl::StrCat(parent, ".", element);
}

// Walks two trees in parallel and visits every pair of payload nodes.
absl::Status WalkPayloadPairs(
    const std::string& path,
    const google::protobuf::Message& lazyNode,
    const google::protobuf::Message& eagerNode,
    const NodeVisitor& visit) {
  const auto* desc = lazyNode.GetDescriptor();
  if (desc != eagerNode.GetDescriptor()) {
    return absl::InternalError(absl::StrCat(
        "structure mismatch at ",
        path.empty() ? "<root>" : path,
        ": ",
        desc->full_name(),
        " vs ",
        eagerNode.GetDescriptor()->full_name()));
  }
  if (!PayloadFields(desc).empty()) {
    if (auto status = visit(path, lazyNode, eagerNode); !status.ok()) {
      return status;
    }
  }
  const auto* lazyReflection = lazyNode.GetReflection();
  const auto* eagerReflection = eagerNode.GetReflection();
  for (const auto* field : ChildFields(desc)) {
    if (field->is_repeated()) {
      int size = lazyReflection->FieldSize(lazyNode, field);
      int eagerSize = eagerReflection->FieldSize(eagerNode, field);
      if (size != eagerSize) {
        return absl::InternalError(absl::StrCat(
            "structure mismatch at ",
            JoinPath(path, field->name()),
            ": lazy read has ",
            size,
            " children, eager read has ",
            eagerSize));
      }
      for (int i = 0; i < size; i++) {
        auto status = WalkPayloadPairs(
            JoinPath(path, absl::StrCat(field->name(), "[", i, "]")),
            lazyReflection->GetRepeatedMessage(lazyNode, field, i),
            eagerReflection->GetRepeatedMessage(eagerNode, field, i),
            visit);
        if (!status.ok()) {
          return status;
        }
      }
    } else if (lazyReflection->HasField(lazyNode, field)) {
      auto status = WalkPayloadPairs(
          JoinPath(path, field->name()),
          lazyReflection->GetMessage(lazyNode, field),
          eagerReflection->GetMessage(eagerNode, field),
          visit);
      if (!status.ok()) {
        return status;
      }
    }
  }
  return absl::OkStatus();
}

int64_t EagerPayloadLength(const google::protobuf::Message& eagerNode) {
  int64_t length = 0;
  const auto* reflection = eagerNode.GetReflection();
  for (const auto* field : PayloadFields(eagerNode.GetDescriptor())) {
    length = std::max<int64_t>(length, reflection->FieldSize(eagerNode, field));
  }
  return length;
}

} // namespace

absl::Status AssertLazyShapesMatch(
    const google::protobuf::Message& lazyObject, const google::protobuf::Message& eagerObject) {
  return WalkPayloadPairs(
      "",
      lazyObject,
      eagerObject,
      [](const std::string& path,
         const google::protobuf::Message& lazyNode,
         const google::protobuf::Message& eagerNode) -> absl::Status {
        const auto* lazyField = LazyInfoField(lazyNode.GetDescriptor());
        if (lazyField == nullptr ||
            !lazyNode.GetReflection()->HasField(lazyNode, lazyField)) {
          return absl::InternalError(
              absl::StrCat("lazy node at ", path.empty() ? "<root>" : path, " has no shape"));
        }
        const auto& lazy = static_cast<const model::LazyInfo&>(
            lazyNode.GetReflection()->GetMessage(lazyNode, lazyField));
        int64_t product = 1;
        for (int64_t dim : lazy.shape()) {
          product *= dim;
        }
        int64_t expected = EagerPayloadLength(eagerNode);
        if (lazy.shape_size() == 0 || product != expected) {
          return absl::InternalError(absl::StrCat(
              "lazy node at ",
              path.empty() ? "<root>" : path,
              " records shape [",
              absl::StrJoin(lazy.shape(), ", "),
              "] but the eager read holds ",
              expected,
              " values"));
        }
        return absl::OkStatus();
      });
}

absl::Status AssertLazyObjectsCanBeLoaded(
    const google::protobuf::Message& lazyObject,
    const google::protobuf::Message& eagerObject,
    const LazyLoadFunc& loader,
    double tolerance) {
  return WalkPayloadPairs(
      "",
      lazyObject,
      eagerObject,
      [&loader, tolerance](
          const std::string& path,
          const google::protobuf::Message& lazyNode,
          const google::protobuf::Message& eagerNode) -> absl::Status {
        auto loaded_or = loader(lazyNode);
        if (!loaded_or.ok()) {
          return loaded_or.status();
        }
        if (*loaded_or == nullptr) {
          return absl::InternalError(absl::StrCat(
              "loading the lazy node at ", path.empty() ? "<root>" : path, " returned nothing"));
        }
        if (auto status = AssertStructurallyEqual(eagerNode, **loaded_or, tolerance);
            !status.ok()) {
          return absl::Status(
              status.code(),
              absl::StrCat(
                  "loaded node at ", path.empty() ? "<root>" : path, ": ", status.message()));
        }
        return absl::OkStatus();
      });
}

} // namespace ioharness
