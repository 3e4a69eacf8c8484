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

#include "ioharness/conformance/runner.h"

#include <filesystem>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ioharness/status.h"
#include "ioharness/testing/proto_file_driver.h"

namespace ioharness::conformance {
namespace {

using ::testing::HasSubstr;

HarnessEnvironment RunnerEnvironment() {
  HarnessEnvironment environment;
  environment.fixtureRoot = (std::filesystem::path(testing::TempDir()) / "runner").string();
  environment.useNetwork = false;
  return environment;
}

TEST(SuiteRunnerTest, ToResult) {
  EXPECT_TRUE(SuiteRunner::toResult(absl::OkStatus()).success());

  auto skipped = SuiteRunner::toResult(SkipError("no lazy support"));
  ASSERT_TRUE(skipped.has_skipped());
  EXPECT_EQ(skipped.skipped().reason(), "no lazy support");

  harness::FailureContext context;
  context.set_scenario("load_lazy_objects");
  auto failed = SuiteRunner::toResult(AnnotateFailure(absl::InternalError("differ"), context));
  EXPECT_THAT(failed.failure(), HasSubstr("differ (in load_lazy_objects)"));
  EXPECT_EQ(failed.context().scenario(), "load_lazy_objects");
}

TEST(SuiteRunnerTest, RunSuites) {
  testdriver::ProtoFileOptions readOnly;
  readOnly.name = "ReadOnlyIO";
  readOnly.supportsLazy = false;
  readOnly.readParams[model::KIND_BLOCK]["sampling_rate"] = Param{"sampling_rate", "", true};

  SuiteRunner runner(RunnerEnvironment());
  auto response = runner.runSuites({
      {testdriver::ProtoFileDriverClass(), SuiteConfig{}},
      {testdriver::ProtoFileDriverClass(readOnly), SuiteConfig{}},
  });
  ASSERT_EQ(response.suites_size(), 2);

  const auto& conforming = response.suites().at("ProtoFileIO");
  EXPECT_EQ(conforming.results_size(), static_cast<int>(Scenarios().size()));
  EXPECT_TRUE(conforming.results().at("write_then_read").success());
  EXPECT_TRUE(conforming.results().at("load_lazy_objects").success());
  EXPECT_TRUE(conforming.results().at("read_then_write").has_skipped());

  const auto& restricted = response.suites().at("ReadOnlyIO");
  EXPECT_TRUE(restricted.results().at("write_then_read").has_skipped());
  EXPECT_TRUE(restricted.results().at("lazy_read_is_compliant").has_skipped());
  EXPECT_TRUE(restricted.results().at("read_objects_are_compliant").success());
}

TEST(SuiteRunnerTest, SetUpOutcomeAppliesToEveryScenario) {
  SuiteConfig config;
  config.filesToDownload = {"remote.pb"};
  SuiteRunner runner(RunnerEnvironment());
  auto result = runner.runSuite({testdriver::ProtoFileDriverClass(), config});
  EXPECT_EQ(result.driver(), "ProtoFileIO");
  for (const auto& [name, scenario] : result.results()) {
    EXPECT_TRUE(scenario.has_skipped()) << name;
  }

  HarnessEnvironment online = RunnerEnvironment();
  online.useNetwork = true;
  SuiteRunner noFetcher(online);
  result = noFetcher.runSuite({testdriver::ProtoFileDriverClass(), config});
  for (const auto& [name, scenario] : result.results()) {
    EXPECT_THAT(scenario.setup_error(), HasSubstr("no fetcher")) << name;
  }
}

} // namespace
} // namespace ioharness::conformance
