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
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "ioharness/fixtures.h"
#include "ioharness/harness/harness.pb.h"
#include "ioharness/suite.h"

namespace ioharness::conformance {

/// A named scenario of ConformanceSuite.
struct Scenario {
  const char* name;
  absl::Status (ConformanceSuite::*run)();
};

/// Every scenario in the order they run.
const std::vector<Scenario>& Scenarios();

/// A driver class and the configuration its suite runs with.
struct SuiteRegistration {
  DriverClass driverClass;
  SuiteConfig config;
};

/// Runs conformance suites and collects their outcomes as harness results.
class SuiteRunner {
 public:
  explicit SuiteRunner(HarnessEnvironment environment, std::shared_ptr<Fetcher> fetcher = nullptr)
      : environment_(std::move(environment)), fetcher_(std::move(fetcher)) {}

  harness::HarnessResponse runSuites(const std::vector<SuiteRegistration>& registrations);
  harness::SuiteResult runSuite(const SuiteRegistration& registration);

  /// Maps the status of one scenario to its result.
  static harness::ScenarioResult toResult(const absl::Status& status);

 private:
  HarnessEnvironment environment_;
  std::shared_ptr<Fetcher> fetcher_;
};

} // namespace ioharness::conformance
