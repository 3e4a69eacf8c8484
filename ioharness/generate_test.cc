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

#include "ioharness/generate.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ioharness {
namespace {

using ::testing::ElementsAre;

TEST(GenerateTest, BlockWithEverySupportedKind) {
  auto object_or = GenerateFromSupportedKinds(
      {model::KIND_BLOCK,
       model::KIND_SEGMENT,
       model::KIND_ANALOG_SIGNAL,
       model::KIND_SPIKE_TRAIN,
       model::KIND_EVENT,
       model::KIND_EPOCH});
  ASSERT_TRUE(object_or.ok()) << object_or.status();
  ASSERT_EQ(KindOf(**object_or), model::KIND_BLOCK);
  const auto& block = static_cast<const model::Block&>(**object_or);
  ASSERT_EQ(block.segments_size(), 2);
  for (int i = 0; i < 2; i++) {
    const auto& segment = block.segments(i);
    EXPECT_EQ(segment.index(), i);
    ASSERT_EQ(segment.analogsignals_size(), 1);
    EXPECT_THAT(segment.analogsignals(0).samples(), ElementsAre(1.0, 2.0, 3.0));
    EXPECT_EQ(segment.spiketrains_size(), 1);
    EXPECT_EQ(segment.events_size(), 1);
    EXPECT_EQ(segment.epochs_size(), 1);
  }
}

TEST(GenerateTest, OnlyIncludedKinds) {
  auto object_or =
      GenerateObject(model::KIND_SEGMENT, {model::KIND_SEGMENT, model::KIND_ANALOG_SIGNAL});
  ASSERT_TRUE(object_or.ok()) << object_or.status();
  const auto& segment = static_cast<const model::Segment&>(**object_or);
  EXPECT_EQ(segment.analogsignals_size(), 1);
  EXPECT_EQ(segment.spiketrains_size(), 0);
  EXPECT_EQ(segment.events_size(), 0);
  EXPECT_EQ(segment.epochs_size(), 0);
}

TEST(GenerateTest, BlockWithoutSegments) {
  auto object_or = GenerateObject(model::KIND_BLOCK, {model::KIND_BLOCK});
  ASSERT_TRUE(object_or.ok()) << object_or.status();
  EXPECT_EQ(static_cast<const model::Block&>(**object_or).segments_size(), 0);
}

TEST(GenerateTest, Deterministic) {
  auto first_or = GenerateFromSupportedKinds({model::KIND_BLOCK, model::KIND_SEGMENT});
  auto second_or = GenerateFromSupportedKinds({model::KIND_BLOCK, model::KIND_SEGMENT});
  ASSERT_TRUE(first_or.ok() && second_or.ok());
  EXPECT_EQ((*first_or)->SerializeAsString(), (*second_or)->SerializeAsString());
}

TEST(GenerateTest, Errors) {
  EXPECT_EQ(
      GenerateFromSupportedKinds({}).status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(
      GenerateObject(model::KIND_UNSPECIFIED, {}).status().code(),
      absl::StatusCode::kInvalidArgument);
}

} // namespace
} // namespace ioharness
