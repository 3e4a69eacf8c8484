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

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/message.h"
#include "ioharness/driver.h"

namespace ioharness {

/// Selects the entry point a generic read or write goes through.
class Target {
 public:
  /// The entry point of the driver's highest supported kind.
  static Target Highest() { return Target(Value(HighestTag{})); }

  /// The untyped Read and Write entry points.
  static Target Untyped() { return Target(Value(UntypedTag{})); }

  /// The entry point registered for a kind.
  static Target Of(Kind kind) { return Target(Value(kind)); }

  /// The entry point registered under a name.
  static Target Named(std::string name) { return Target(Value(std::move(name))); }

  [[nodiscard]] bool isHighest() const { return std::holds_alternative<HighestTag>(value_); }
  [[nodiscard]] bool isUntyped() const { return std::holds_alternative<UntypedTag>(value_); }

  /// The entry point name this target resolves to on `driver`, or an empty
  /// string for the untyped target.
  absl::StatusOr<std::string> EntryName(const Driver& driver) const;

  [[nodiscard]] std::string DebugString() const;

 private:
  struct HighestTag {};
  struct UntypedTag {};

  using Value = std::variant<HighestTag, UntypedTag, Kind, std::string>;

  explicit Target(Value value) : value_(std::move(value)) {}

  Value value_;
};

using Reader = std::function<absl::StatusOr<Objects>()>;
using Writer = std::function<absl::Status(const google::protobuf::Message&)>;

/// Resolves the reader selected by `target`.
///
/// `lazy` is forwarded unchanged to the entry point. `readAll` selects the
/// entry point reading every object of the kind instead of the primary one;
/// the untyped reader always reads every top level object. Returns NotFound
/// if the driver does not register the selected entry point. The returned
/// reader refers to `driver`, which must outlive it.
absl::StatusOr<Reader> ResolveReader(Driver& driver, const Target& target, bool lazy, bool readAll);

/// Resolves the writer selected by `target`. The returned writer refers to
/// `driver`, which must outlive it.
absl::StatusOr<Writer> ResolveWriter(Driver& driver, const Target& target);

/// Resolves and invokes a reader.
absl::StatusOr<Objects> ReadGeneric(
    Driver& driver, const Target& target, bool lazy = false, bool readAll = false);

/// Resolves and invokes a writer.
///
/// If `object` is null, a sample is generated from the driver's supported
/// kinds. Returns a copy of the object that was written.
absl::StatusOr<std::unique_ptr<google::protobuf::Message>> WriteGeneric(
    Driver& driver, const Target& target, const google::protobuf::Message* object = nullptr);

} // namespace ioharness
