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

#include "ioharness/dispatch.h"

#include <memory>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ioharness/equivalence.h"

namespace ioharness {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

class MockDriver : public Driver {
 public:
  explicit MockDriver(std::shared_ptr<const DriverDescriptor> descriptor)
      : Driver(std::move(descriptor), "mock.bin") {}

  MOCK_METHOD(absl::StatusOr<Objects>, Read, (const ReadOptions& options), (override));
  MOCK_METHOD(absl::Status, Write, (const google::protobuf::Message& object), (override));
  MOCK_METHOD(absl::Status, Close, (), (override));

  EntryPointTable& table() { return entryPoints_; }
};

std::shared_ptr<const DriverDescriptor> SegmentDescriptor() {
  auto descriptor = std::make_shared<DriverDescriptor>();
  descriptor->name = "MockIO";
  descriptor->readableKinds = {model::KIND_SEGMENT};
  descriptor->writeableKinds = {model::KIND_SEGMENT};
  descriptor->supportedKinds = {model::KIND_SEGMENT, model::KIND_ANALOG_SIGNAL};
  return descriptor;
}

ReadFunc SingleSegmentReader(std::string name, bool* lazySeen) {
  return [name = std::move(name), lazySeen](const ReadOptions& options) -> absl::StatusOr<Objects> {
    *lazySeen = options.lazy;
    auto segment = std::make_unique<model::Segment>();
    segment->set_name(name);
    Objects objects;
    objects.push_back(std::move(segment));
    return objects;
  };
}

TEST(DispatchTest, HighestResolvesToFirstSupportedKind) {
  MockDriver driver(SegmentDescriptor());
  bool lazySeen = false;
  driver.table().AddReader("segment", SingleSegmentReader("primary", &lazySeen));

  auto name_or = Target::Highest().EntryName(driver);
  ASSERT_TRUE(name_or.ok()) << name_or.status();
  EXPECT_EQ(*name_or, "segment");

  auto objects_or = ReadGeneric(driver, Target::Highest(), true);
  ASSERT_TRUE(objects_or.ok()) << objects_or.status();
  ASSERT_EQ(objects_or->size(), 1);
  EXPECT_EQ(static_cast<const model::Segment&>(*objects_or->front()).name(), "primary");
  EXPECT_TRUE(lazySeen);
}

TEST(DispatchTest, ReadAllSelectsItsOwnTable) {
  MockDriver driver(SegmentDescriptor());
  bool lazySeen = true;
  driver.table().AddReader("segment", SingleSegmentReader("primary", &lazySeen));
  driver.table().AddReadAll("segment", SingleSegmentReader("all", &lazySeen));

  auto objects_or = ReadGeneric(driver, Target::Of(model::KIND_SEGMENT), false, true);
  ASSERT_TRUE(objects_or.ok()) << objects_or.status();
  EXPECT_EQ(static_cast<const model::Segment&>(*objects_or->front()).name(), "all");
  EXPECT_FALSE(lazySeen);
}

TEST(DispatchTest, MissingEntryPointIsNotFound) {
  MockDriver driver(SegmentDescriptor());
  auto reader_or = ResolveReader(driver, Target::Of(model::KIND_BLOCK), false, true);
  EXPECT_EQ(reader_or.status().code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(reader_or.status().message(), "driver MockIO has no read_all_block entry point");

  auto writer_or = ResolveWriter(driver, Target::Named("analogsignal"));
  EXPECT_EQ(writer_or.status().code(), absl::StatusCode::kNotFound);
  EXPECT_THAT(writer_or.status().message(), HasSubstr("write_analogsignal"));
}

TEST(DispatchTest, HighestWithoutSupportedKinds) {
  MockDriver driver(std::make_shared<DriverDescriptor>());
  EXPECT_EQ(Target::Highest().EntryName(driver).status().code(), absl::StatusCode::kNotFound);
}

TEST(DispatchTest, UntypedUsesReadAndWrite) {
  MockDriver driver(SegmentDescriptor());
  EXPECT_CALL(driver, Read(_)).WillOnce([](const ReadOptions& options) {
    EXPECT_TRUE(options.lazy);
    return absl::StatusOr<Objects>(Objects{});
  });
  EXPECT_CALL(driver, Write(_)).WillOnce(Return(absl::OkStatus()));

  auto objects_or = ReadGeneric(driver, Target::Untyped(), true, true);
  ASSERT_TRUE(objects_or.ok()) << objects_or.status();
  EXPECT_TRUE(objects_or->empty());

  model::Segment segment;
  auto written_or = WriteGeneric(driver, Target::Untyped(), &segment);
  ASSERT_TRUE(written_or.ok()) << written_or.status();
}

TEST(DispatchTest, WriteGeneratesSample) {
  MockDriver driver(SegmentDescriptor());
  model::Segment received;
  driver.table().AddWriter("segment", [&received](const google::protobuf::Message& object) {
    received.CopyFrom(object);
    return absl::OkStatus();
  });
  auto written_or = WriteGeneric(driver, Target::Highest());
  ASSERT_TRUE(written_or.ok()) << written_or.status();
  EXPECT_EQ(KindOf(**written_or), model::KIND_SEGMENT);
  EXPECT_TRUE(StructurallyEqual(**written_or, received, kDefaultTolerance));
  EXPECT_EQ(received.analogsignals_size(), 1);
  EXPECT_EQ(received.spiketrains_size(), 0);
}

TEST(DispatchTest, WriterErrorPropagates) {
  MockDriver driver(SegmentDescriptor());
  driver.table().AddWriter("segment", [](const google::protobuf::Message&) {
    return absl::PermissionDeniedError("read only");
  });
  model::Segment segment;
  auto written_or = WriteGeneric(driver, Target::Of(model::KIND_SEGMENT), &segment);
  EXPECT_EQ(written_or.status().code(), absl::StatusCode::kPermissionDenied);
}

TEST(DispatchTest, DebugString) {
  EXPECT_EQ(Target::Highest().DebugString(), "highest");
  EXPECT_EQ(Target::Untyped().DebugString(), "untyped");
  EXPECT_EQ(Target::Of(model::KIND_BLOCK).DebugString(), "kind KIND_BLOCK");
  EXPECT_EQ(Target::Named("segment").DebugString(), "name segment");
}

} // namespace
} // namespace ioharness
