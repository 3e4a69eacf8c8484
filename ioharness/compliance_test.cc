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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ioharness/generate.h"

namespace ioharness {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Property;

auto ViolationIs(const std::string& path, const std::string& ruleId) {
  return AllOf(
      Property(&model::Violation::path, path), Property(&model::Violation::rule_id, ruleId));
}

class ComplianceTest : public testing::Test {
 public:
  void SetUp() override {
    auto checker_or = ComplianceChecker::New();
    ASSERT_TRUE(checker_or.ok()) << checker_or.status();
    checker_ = std::move(checker_or).value();
  }

 protected:
  std::unique_ptr<ComplianceChecker> checker_;

  static model::Block GeneratedBlock() {
    auto object_or = GenerateFromSupportedKinds(
        {model::KIND_BLOCK,
         model::KIND_SEGMENT,
         model::KIND_ANALOG_SIGNAL,
         model::KIND_SPIKE_TRAIN,
         model::KIND_EVENT,
         model::KIND_EPOCH});
    return static_cast<const model::Block&>(*object_or.value());
  }
};

TEST_F(ComplianceTest, GeneratedObjectsAreCompliant) {
  auto block = GeneratedBlock();
  auto violations_or = checker_->Check(block);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_EQ(violations_or->violations_size(), 0) << violations_or->DebugString();
  EXPECT_TRUE(checker_->AssertCompliant(block).ok());
}

TEST_F(ComplianceTest, RequiredUnits) {
  auto block = GeneratedBlock();
  block.mutable_segments(1)->mutable_analogsignals(0)->clear_units();
  auto violations_or = checker_->Check(block);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(
      violations_or->violations(),
      ElementsAre(ViolationIs("segments[1].analogsignals[0].units", "required")));

  auto status = checker_->AssertCompliant(block);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("Block is not compliant"));
  EXPECT_THAT(status.message(), HasSubstr("segments[1].analogsignals[0].units"));
}

TEST_F(ComplianceTest, CelRules) {
  model::SpikeTrain train;
  train.set_units("s");
  train.set_t_start(5);
  train.set_t_stop(1);
  auto violations_or = checker_->Check(train);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(violations_or->violations(), ElementsAre(ViolationIs("", "spiketrain.t_stop")));

  train.set_t_stop(10);
  train.add_times(11);
  violations_or = checker_->Check(train);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(violations_or->violations(), ElementsAre(ViolationIs("", "spiketrain.times")));
}

TEST_F(ComplianceTest, DuplicateSegmentIndex) {
  auto block = GeneratedBlock();
  block.mutable_segments(1)->set_index(0);
  auto violations_or = checker_->Check(block);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(violations_or->violations(), ElementsAre(ViolationIs("", "block.segment_index")));
}

TEST_F(ComplianceTest, FailFast) {
  auto block = GeneratedBlock();
  for (auto& segment : *block.mutable_segments()) {
    segment.mutable_analogsignals(0)->clear_units();
  }
  checker_->SetFailFast(true);
  auto violations_or = checker_->Check(block);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_EQ(violations_or->violations_size(), 1);
}

TEST_F(ComplianceTest, EagerObjectIsNotLazy) {
  auto block = GeneratedBlock();
  auto violations_or = checker_->CheckLazy(block.segments(0));
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(
      violations_or->violations(),
      testing::Contains(ViolationIs("analogsignals[0].samples", "lazy.payload")));
  EXPECT_THAT(
      violations_or->violations(), testing::Contains(ViolationIs("analogsignals[0]", "lazy.shape")));
  EXPECT_THAT(
      checker_->AssertLazyCompliant(block).message(), HasSubstr("Block is not lazily loaded"));
}

TEST_F(ComplianceTest, LazyObject) {
  model::AnalogSignal signal;
  signal.set_units("mV");
  signal.set_sampling_rate(1000);
  signal.mutable_lazy()->add_shape(3);
  EXPECT_TRUE(checker_->AssertLazyCompliant(signal).ok());
  EXPECT_TRUE(checker_->AssertCompliant(signal).ok());

  signal.mutable_lazy()->clear_shape();
  auto violations_or = checker_->CheckLazy(signal);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(violations_or->violations(), ElementsAre(ViolationIs("", "lazy.shape")));
}

TEST_F(ComplianceTest, LazySignalWithSamplesIsNotCompliant) {
  model::AnalogSignal signal;
  signal.set_units("mV");
  signal.set_sampling_rate(1000);
  signal.add_samples(1.0);
  signal.mutable_lazy()->add_shape(1);
  auto violations_or = checker_->Check(signal);
  ASSERT_TRUE(violations_or.ok()) << violations_or.status();
  EXPECT_THAT(violations_or->violations(), ElementsAre(ViolationIs("", "analogsignal.lazy")));
}

} // namespace
} // namespace ioharness
