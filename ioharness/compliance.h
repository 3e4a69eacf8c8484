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

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "eval/public/cel_expression.h"
#include "google/protobuf/arena.h"
#include "google/protobuf/message.h"
#include "ioharness/internal/rules.h"
#include "ioharness/model/schema.pb.h"

namespace ioharness {

/// Checks objects of the domain model against the rules declared in the
/// schema.
///
/// A checker is thread-safe and caches the compiled rules of every node type
/// it has seen. Generally there should be one checker per suite.
class ComplianceChecker {
 public:
  /// Create a new checker.
  static absl::StatusOr<std::unique_ptr<ComplianceChecker>> New();

  /// Not copyable or movable.
  ComplianceChecker(const ComplianceChecker&) = delete;
  ComplianceChecker& operator=(const ComplianceChecker&) = delete;
  ComplianceChecker(ComplianceChecker&&) = delete;
  ComplianceChecker& operator=(ComplianceChecker&&) = delete;

  /// Checks `object` and every node reachable from it.
  ///
  /// Returns the violations found, which is empty if the object is compliant.
  /// If a rule cannot be evaluated, a Status with the error is returned.
  absl::StatusOr<model::Violations> Check(const google::protobuf::Message& object);

  /// Checks that every payload node reachable from `object` was lazily read:
  /// its payload fields are empty and it records the shape of its payload.
  absl::StatusOr<model::Violations> CheckLazy(const google::protobuf::Message& object);

  /// Returns an Internal error listing the violations if `object` is not compliant.
  absl::Status AssertCompliant(const google::protobuf::Message& object);

  /// Returns an Internal error listing the violations if `object` is not lazily loaded.
  absl::Status AssertLazyCompliant(const google::protobuf::Message& object);

  /// Stop at the first violation. Defaults to false.
  void SetFailFast(bool failFast) { failFast_ = failFast; }

 private:
  google::protobuf::Arena arena_;
  absl::Mutex mutex_;
  bool failFast_ = false;
  absl::flat_hash_map<const google::protobuf::Descriptor*, internal::Rules> rules_
      ABSL_GUARDED_BY(mutex_);
  std::unique_ptr<google::api::expr::runtime::CelExpressionBuilder> builder_
      ABSL_GUARDED_BY(mutex_);

  ComplianceChecker() = default;

  const internal::Rules* GetNodeRules(const google::protobuf::Descriptor* desc);

  absl::Status CheckNode(internal::RuleContext& ctx, const google::protobuf::Message& message);
};

} // namespace ioharness
