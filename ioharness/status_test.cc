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

#include "ioharness/status.h"

#include "gtest/gtest.h"

namespace ioharness {
namespace {

TEST(StatusTest, Skip) {
  auto status = SkipError("no network");
  EXPECT_EQ(status.code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_TRUE(IsSkip(status));
  EXPECT_EQ(SkipReason(status), "no network");

  auto failure = absl::FailedPreconditionError("no network");
  EXPECT_FALSE(IsSkip(failure));
  EXPECT_EQ(SkipReason(failure), "");
  EXPECT_FALSE(IsSkip(absl::OkStatus()));
}

TEST(StatusTest, AnnotateKeepsCodeAndMessage) {
  harness::FailureContext context;
  context.set_scenario("write_then_read");
  context.set_fixture("Generated0_ExampleIO.pb");
  context.set_lazy(true);
  auto status = AnnotateFailure(absl::NotFoundError("no read_block entry point"), context);
  EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(
      status.message(),
      "no read_block entry point (in write_then_read from Generated0_ExampleIO.pb with "
      "lazy=true read_all=false)");
  auto attached = GetFailureContext(status);
  ASSERT_TRUE(attached.has_value());
  EXPECT_EQ(attached->fixture(), "Generated0_ExampleIO.pb");
  EXPECT_TRUE(attached->lazy());
}

TEST(StatusTest, InnerContextTakesPrecedence) {
  harness::FailureContext inner;
  inner.set_object("read");
  inner.set_tolerance(1e-8);
  harness::FailureContext outer;
  outer.set_scenario("write_then_read");
  outer.set_object("written");
  auto status = AnnotateFailure(AnnotateFailure(absl::InternalError("differ"), inner), outer);
  auto attached = GetFailureContext(status);
  ASSERT_TRUE(attached.has_value());
  EXPECT_EQ(attached->object(), "read");
  EXPECT_EQ(attached->scenario(), "write_then_read");
  EXPECT_DOUBLE_EQ(attached->tolerance(), 1e-8);
}

TEST(StatusTest, AnnotateLeavesSkipAndOkUnchanged) {
  harness::FailureContext context;
  context.set_scenario("load_lazy_objects");
  EXPECT_TRUE(AnnotateFailure(absl::OkStatus(), context).ok());
  auto skip = AnnotateFailure(SkipError("no lazy loader"), context);
  EXPECT_TRUE(IsSkip(skip));
  EXPECT_EQ(skip.message(), "no lazy loader");
  EXPECT_FALSE(GetFailureContext(skip).has_value());
}

TEST(StatusTest, DescribeContext) {
  harness::FailureContext context;
  EXPECT_EQ(DescribeContext(context), "");
  context.set_object("written");
  context.set_tolerance(0.5);
  EXPECT_EQ(DescribeContext(context), "for written object at tolerance 0.5");
}

} // namespace
} // namespace ioharness
