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

#include "ioharness/compliance.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "ioharness/kind.h"

namespace ioharness {
namespace {

using Visitor = std::function<absl::Status(internal::RuleContext&, const google::protobuf::Message&)>;

// Visits `message` and then every node below it, prefixing the path of any
// violation with the position of the node that produced it.
absl::Status WalkTree(
    internal::RuleContext& ctx, const google::protobuf::Message& message, const Visitor& visit) {
  if (auto status = visit(ctx, message); ctx.shouldReturn(status)) {
    return status;
  }
  const auto* reflection = message.GetReflection();
  for (const auto* field : ChildFields(message.GetDescriptor())) {
    if (field->is_repeated()) {
      int size = reflection->FieldSize(message, field);
      for (int i = 0; i < size; i++) {
        int pos = ctx.violations.violations_size();
        auto status = WalkTree(ctx, reflection->GetRepeatedMessage(message, field, i), visit);
        ctx.prependPathElement(absl::StrCat(field->name(), "[", i, "]"), pos);
        if (ctx.shouldReturn(status)) {
          return status;
        }
      }
    } else if (reflection->HasField(message, field)) {
      int pos = ctx.violations.violations_size();
      auto status = WalkTree(ctx, reflection->GetMessage(message, field), visit);
      ctx.prependPathElement(field->name(), pos);
      if (ctx.shouldReturn(status)) {
        return status;
      }
    }
  }
  return absl::OkStatus();
}

absl::Status CheckLazyNode(internal::RuleContext& ctx, const google::protobuf::Message& message) {
  const auto* desc = message.GetDescriptor();
  auto payloadFields = PayloadFields(desc);
  if (payloadFields.empty()) {
    return absl::OkStatus();
  }
  const auto* reflection = message.GetReflection();
  for (const auto* field : payloadFields) {
    if (reflection->FieldSize(message, field) != 0) {
      int pos = ctx.violations.violations_size();
      ctx.addViolation("lazy.payload", "payload must be empty in a lazy object");
      ctx.prependPathElement(field->name(), pos);
    }
  }
  const auto* lazyField = LazyInfoField(desc);
  if (lazyField == nullptr) {
    return absl::InternalError(
        absl::StrCat(desc->full_name(), " has payload fields but no LazyInfo field"));
  }
  if (!reflection->HasField(message, lazyField)) {
    ctx.addViolation("lazy.shape", "lazy object must record the shape of its payload");
    return absl::OkStatus();
  }
  const auto& lazy =
      static_cast<const model::LazyInfo&>(reflection->GetMessage(message, lazyField));
  if (lazy.shape_size() == 0) {
    ctx.addViolation("lazy.shape", "lazy object must record the shape of its payload");
  }
  return absl::OkStatus();
}

absl::Status ViolationsError(std::string_view what, const model::Violations& violations) {
  std::vector<std::string> lines;
  for (const auto& violation : violations.violations()) {
    lines.push_back(absl::StrCat(
        violation.path().empty() ? "<root>" : violation.path(),
        ": ",
        violation.message(),
        " [",
        violation.rule_id(),
        "]"));
  }
  return absl::InternalError(absl::StrCat(what, ": ", absl::StrJoin(lines, "; ")));
}

} // namespace

absl::StatusOr<std::unique_ptr<ComplianceChecker>> ComplianceChecker::New() {
  std::unique_ptr<ComplianceChecker> result(new ComplianceChecker());
  auto builder_or = internal::NewRuleBuilder(&result->arena_);
  if (!builder_or.ok()) {
    return builder_or.status();
  }
  absl::MutexLock lock(&result->mutex_);
  result->builder_ = std::move(builder_or).value();
  return result;
}

const internal::Rules* ComplianceChecker::GetNodeRules(const google::protobuf::Descriptor* desc) {
  {
    absl::ReaderMutexLock lock(&mutex_);
    auto iter = rules_.find(desc);
    if (iter != rules_.end()) {
      return &iter->second;
    }
  }
  absl::WriterMutexLock lock(&mutex_);
  auto iter = rules_.find(desc);
  if (iter != rules_.end()) {
    return &iter->second;
  }
  return &rules_.emplace(desc, internal::NewNodeRules(*builder_, desc)).first->second;
}

absl::Status ComplianceChecker::CheckNode(
    internal::RuleContext& ctx, const google::protobuf::Message& message) {
  const auto* rules_or = GetNodeRules(message.GetDescriptor());
  if (!rules_or->ok()) {
    return rules_or->status();
  }
  return rules_or->value()->Validate(ctx, message);
}

absl::StatusOr<model::Violations> ComplianceChecker::Check(const google::protobuf::Message& object) {
  google::protobuf::Arena arena;
  internal::RuleContext ctx;
  ctx.failFast = failFast_;
  ctx.arena = &arena;
  auto status = WalkTree(ctx, object, [this](internal::RuleContext& nodeCtx, const auto& message) {
    return CheckNode(nodeCtx, message);
  });
  if (!status.ok()) {
    return status;
  }
  return std::move(ctx.violations);
}

absl::StatusOr<model::Violations> ComplianceChecker::CheckLazy(
    const google::protobuf::Message& object) {
  internal::RuleContext ctx;
  ctx.failFast = failFast_;
  auto status = WalkTree(ctx, object, CheckLazyNode);
  if (!status.ok()) {
    return status;
  }
  return std::move(ctx.violations);
}

absl::Status ComplianceChecker::AssertCompliant(const google::protobuf::Message& object) {
  auto violations_or = Check(object);
  if (!violations_or.ok()) {
    return violations_or.status();
  }
  if (violations_or->violations_size() > 0) {
    return ViolationsError(
        absl::StrCat(object.GetDescriptor()->name(), " is not compliant"), *violations_or);
  }
  return absl::OkStatus();
}

absl::Status ComplianceChecker::AssertLazyCompliant(const google::protobuf::Message& object) {
  auto violations_or = CheckLazy(object);
  if (!violations_or.ok()) {
    return violations_or.status();
  }
  if (violations_or->violations_size() > 0) {
    return ViolationsError(
        absl::StrCat(object.GetDescriptor()->name(), " is not lazily loaded"), *violations_or);
  }
  return absl::OkStatus();
}

} // namespace ioharness
