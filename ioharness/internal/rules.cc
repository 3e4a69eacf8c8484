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

#include "ioharness/internal/rules.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "eval/public/builtin_func_registrar.h"
#include "eval/public/cel_expr_builder_factory.h"
#include "eval/public/cel_value.h"
#include "eval/public/structs/cel_proto_wrapper.h"
#include "parser/parser.h"

namespace ioharness::internal {
namespace cel = google::api::expr;

namespace {

absl::Status ProcessRule(
    RuleContext& ctx,
    const google::api::expr::runtime::BaseActivation& activation,
    const CompiledRule& expr) {
  auto result_or = expr.expr->Evaluate(activation, ctx.arena);
  if (!result_or.ok()) {
    return result_or.status();
  }
  cel::runtime::CelValue result = std::move(result_or).value();
  if (result.IsBool()) {
    if (!result.BoolOrDie()) {
      ctx.addViolation(expr.rule.id(), expr.rule.message());
    }
  } else if (result.IsString()) {
    if (!result.StringOrDie().value().empty()) {
      ctx.addViolation(expr.rule.id(), result.StringOrDie().value());
    }
  } else if (result.IsError()) {
    const cel::runtime::CelError& error = *result.ErrorOrDie();
    return {absl::StatusCode::kInvalidArgument,
            absl::StrCat("rule ", expr.rule.id(), ": ", error.message())};
  } else {
    return {absl::StatusCode::kInvalidArgument,
            absl::StrCat("rule ", expr.rule.id(), ": invalid result type")};
  }
  return absl::OkStatus();
}

bool IsPopulated(const google::protobuf::Message& message, const google::protobuf::FieldDescriptor* field) {
  const auto* reflection = message.GetReflection();
  if (field->is_repeated()) {
    return reflection->FieldSize(message, field) > 0;
  }
  switch (field->cpp_type()) {
    case google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE:
      return reflection->HasField(message, field);
    case google::protobuf::FieldDescriptor::CPPTYPE_STRING:
      return !reflection->GetString(message, field).empty();
    default:
      // Proto3 scalars without presence are populated when non-zero.
      return reflection->HasField(message, field);
  }
}

} // namespace

void RuleContext::prependPathElement(std::string_view element, int start) {
  for (int i = start; i < violations.violations_size(); i++) {
    auto* violation = violations.mutable_violations(i);
    if (violation->path().empty()) {
      *violation->mutable_path() = element;
    } else {
      *violation->mutable_path() = absl::StrCat(element, ".", violation->path());
    }
  }
}

absl::Status NodeRules::Add(
    google::api::expr::runtime::CelExpressionBuilder& builder, model::Rule rule) {
  auto pexpr_or = cel::parser::Parse(rule.expression());
  if (!pexpr_or.ok()) {
    return pexpr_or.status();
  }
  cel::v1alpha1::ParsedExpr pexpr = std::move(pexpr_or).value();
  auto expr_or = builder.CreateExpression(pexpr.mutable_expr(), pexpr.mutable_source_info());
  if (!expr_or.ok()) {
    return expr_or.status();
  }
  std::unique_ptr<cel::runtime::CelExpression> expr = std::move(expr_or).value();
  exprs_.emplace_back(CompiledRule{std::move(rule), std::move(expr)});
  return absl::OkStatus();
}

absl::Status NodeRules::Validate(RuleContext& ctx, const google::protobuf::Message& message) const {
  ValidateRequired(ctx, message);
  if (ctx.failFast && ctx.violations.violations_size() > 0) {
    return absl::OkStatus();
  }
  google::api::expr::runtime::Activation activation;
  activation.InsertValue("this", cel::runtime::CelProtoWrapper::CreateMessage(&message, ctx.arena));
  return ValidateCel(ctx, activation);
}

absl::Status NodeRules::ValidateCel(
    RuleContext& ctx, google::api::expr::runtime::Activation& activation) const {
  absl::Status status = absl::OkStatus();
  for (const auto& expr : exprs_) {
    status = ProcessRule(ctx, activation, expr);
    if (ctx.shouldReturn(status)) {
      break;
    }
  }
  return status;
}

void NodeRules::ValidateRequired(RuleContext& ctx, const google::protobuf::Message& message) const {
  for (const auto* field : requiredFields_) {
    if (!IsPopulated(message, field)) {
      int pos = ctx.violations.violations_size();
      ctx.addViolation("required", "value is required");
      ctx.prependPathElement(field->name(), pos);
      if (ctx.failFast) {
        return;
      }
    }
  }
}

absl::StatusOr<std::unique_ptr<google::api::expr::runtime::CelExpressionBuilder>> NewRuleBuilder(
    google::protobuf::Arena* arena) {
  cel::runtime::InterpreterOptions options;
  options.enable_qualified_type_identifiers = true;
  options.enable_heterogeneous_equality = true;
  options.enable_empty_wrapper_null_unboxing = true;
  options.enable_regex_precompilation = true;
  options.constant_folding = true;
  options.constant_arena = arena;

  std::unique_ptr<cel::runtime::CelExpressionBuilder> builder =
      cel::runtime::CreateCelExpressionBuilder(options);
  auto register_status = cel::runtime::RegisterBuiltinFunctions(builder->GetRegistry(), options);
  if (!register_status.ok()) {
    return register_status;
  }
  return builder;
}

Rules NewNodeRules(
    google::api::expr::runtime::CelExpressionBuilder& builder,
    const google::protobuf::Descriptor* descriptor) {
  auto result = std::make_unique<NodeRules>();
  if (descriptor->options().HasExtension(model::node)) {
    const auto& nodeLvl = descriptor->options().GetExtension(model::node);
    for (const auto& rule : nodeLvl.rules()) {
      if (auto status = result->Add(builder, rule); !status.ok()) {
        return absl::FailedPreconditionError(absl::StrCat(
            "failed to compile rule ",
            rule.id(),
            " of ",
            descriptor->full_name(),
            ": ",
            status.message()));
      }
    }
  }
  for (int i = 0; i < descriptor->field_count(); i++) {
    const google::protobuf::FieldDescriptor* field = descriptor->field(i);
    if (field->options().HasExtension(model::field) &&
        field->options().GetExtension(model::field).required()) {
      result->AddRequiredField(field);
    }
  }
  return result;
}

} // namespace ioharness::internal
