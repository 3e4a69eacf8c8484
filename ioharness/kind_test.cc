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

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ioharness {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Property;

TEST(KindTest, DescriptorRoundTrip) {
  for (Kind kind :
       {model::KIND_BLOCK,
        model::KIND_SEGMENT,
        model::KIND_ANALOG_SIGNAL,
        model::KIND_SPIKE_TRAIN,
        model::KIND_EVENT,
        model::KIND_EPOCH}) {
    const auto* desc = KindDescriptor(kind);
    ASSERT_NE(desc, nullptr) << model::Kind_Name(kind);
    EXPECT_EQ(KindOf(desc), kind);
  }
  EXPECT_EQ(KindDescriptor(model::KIND_UNSPECIFIED), nullptr);
  EXPECT_EQ(KindOf(model::LazyInfo::descriptor()), model::KIND_UNSPECIFIED);
}

TEST(KindTest, KindName) {
  EXPECT_EQ(KindName(model::KIND_BLOCK), "block");
  EXPECT_EQ(KindName(model::KIND_ANALOG_SIGNAL), "analogsignal");
  EXPECT_EQ(KindName(model::KIND_SPIKE_TRAIN), "spiketrain");
}

TEST(KindTest, NewObject) {
  auto object_or = NewObject(model::KIND_SEGMENT);
  ASSERT_TRUE(object_or.ok()) << object_or.status();
  EXPECT_EQ((*object_or)->GetDescriptor(), model::Segment::descriptor());
  EXPECT_EQ(NewObject(model::KIND_UNSPECIFIED).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(KindTest, PayloadAndLazyFields) {
  EXPECT_THAT(
      PayloadFields(model::AnalogSignal::descriptor()),
      ElementsAre(Property(&google::protobuf::FieldDescriptor::name, "samples")));
  EXPECT_THAT(
      PayloadFields(model::Epoch::descriptor()),
      ElementsAre(
          Property(&google::protobuf::FieldDescriptor::name, "times"),
          Property(&google::protobuf::FieldDescriptor::name, "durations"),
          Property(&google::protobuf::FieldDescriptor::name, "labels")));
  EXPECT_THAT(PayloadFields(model::Block::descriptor()), IsEmpty());

  const auto* lazy = LazyInfoField(model::SpikeTrain::descriptor());
  ASSERT_NE(lazy, nullptr);
  EXPECT_EQ(lazy->name(), "lazy");
  EXPECT_EQ(LazyInfoField(model::Segment::descriptor()), nullptr);
}

TEST(KindTest, ChildFields) {
  EXPECT_THAT(
      ChildFields(model::Block::descriptor()),
      ElementsAre(Property(&google::protobuf::FieldDescriptor::name, "segments")));
  EXPECT_EQ(ChildFields(model::Segment::descriptor()).size(), 4);
  EXPECT_THAT(ChildFields(model::AnalogSignal::descriptor()), IsEmpty());
}

} // namespace
} // namespace ioharness
