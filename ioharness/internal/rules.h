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
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "eval/public/activation.h"
#include "eval/public/cel_expression.h"
#include "google/protobuf/arena.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "ioharness/model/schema.pb.h"

namespace ioharness::internal {

struct CompiledRule {
  model::Rule rule;
  std::unique_ptr<google::api::expr::runtime::CelExpression> expr;
};

struct RuleContext {
  RuleContext() : failFast(false), arena(nullptr) {}
  RuleContext(const RuleContext&) = delete;
  void operator=(const RuleContext&) = delete;

  bool failFast;
  google::protobuf::Arena* arena;
  model::Violations violations;

  [[nodiscard]] bool shouldReturn(const absl::Status& status) const {
    return !status.ok() || (failFast && violations.violations_size() > 0);
  }

  void addViolation(std::string_view ruleId, std::string_view message) {
    auto& violation = *violations.add_violations();
    *violation.mutable_rule_id() = ruleId;
    *violation.mutable_message() = message;
  }

  // Prefixes the path of every violation recorded since `start`.
  void prependPathElement(std::string_view element, int start);
};

/// The rules of one node type: compiled CEL expressions and required fields.
class NodeRules {
 public:
  NodeRules() = default;
  NodeRules(const NodeRules&) = delete;
  void operator=(const NodeRules&) = delete;

  absl::Status Add(google::api::expr::runtime::CelExpressionBuilder& builder, model::Rule rule);

  void AddRequiredField(const google::protobuf::FieldDescriptor* field) {
    requiredFields_.push_back(field);
  }

  /// Evaluates every rule with `message` bound to `this`.
  absl::Status Validate(RuleContext& ctx, const google::protobuf::Message& message) const;

  [[nodiscard]] const std::vector<CompiledRule>& getExprs() const { return exprs_; }

 private:
  std::vector<CompiledRule> exprs_;
  std::vector<const google::protobuf::FieldDescriptor*> requiredFields_;

  absl::Status ValidateCel(
      RuleContext& ctx, google::api::expr::runtime::Activation& activation) const;

  void ValidateRequired(RuleContext& ctx, const google::protobuf::Message& message) const;
};

// Creates a new expression builder suitable for compiling rules.
absl::StatusOr<std::unique_ptr<google::api::expr::runtime::CelExpressionBuilder>> NewRuleBuilder(
    google::protobuf::Arena* arena);

using Rules = absl::StatusOr<std::unique_ptr<NodeRules>>;

// Compiles the rules declared on a message type through the `node` and
// `field` options. Message types without rules yield an empty NodeRules.
Rules NewNodeRules(
    google::api::expr::runtime::CelExpressionBuilder& builder,
    const google::protobuf::Descriptor* descriptor);

} // namespace ioharness::internal
