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

#include "ioharness/status.h"

namespace ioharness::conformance {

const std::vector<Scenario>& Scenarios() {
  static const auto* scenarios = new std::vector<Scenario>{
      {"write_then_read", &ConformanceSuite::WriteThenRead},
      {"read_then_write", &ConformanceSuite::ReadThenWrite},
      {"read_objects_are_compliant", &ConformanceSuite::ReadObjectsAreCompliant},
      {"lazy_read_is_compliant", &ConformanceSuite::LazyReadIsCompliant},
      {"load_lazy_objects", &ConformanceSuite::LoadLazyObjects},
      {"read_is_idempotent", &ConformanceSuite::ReadIsIdempotent},
  };
  return *scenarios;
}

harness::HarnessResponse SuiteRunner::runSuites(
    const std::vector<SuiteRegistration>& registrations) {
  harness::HarnessResponse response;
  for (const auto& registration : registrations) {
    auto result = runSuite(registration);
    auto& slot = response.mutable_suites()->operator[](result.driver());
    slot = std::move(result);
  }
  return response;
}

harness::SuiteResult SuiteRunner::runSuite(const SuiteRegistration& registration) {
  harness::SuiteResult result;
  if (registration.driverClass.descriptor != nullptr) {
    *result.mutable_driver() = registration.driverClass.descriptor->name;
  }
  auto& results = *result.mutable_results();
  auto suite_or = ConformanceSuite::New(
      registration.driverClass, registration.config, environment_, fetcher_);
  absl::Status setup = suite_or.ok() ? suite_or.value()->SetUp() : suite_or.status();
  for (const auto& scenario : Scenarios()) {
    auto& scenarioResult = results[scenario.name];
    if (IsSkip(setup)) {
      *scenarioResult.mutable_skipped()->mutable_reason() = SkipReason(setup);
    } else if (!setup.ok()) {
      *scenarioResult.mutable_setup_error() =
          setup.ToString(absl::StatusToStringMode::kWithNoExtraData);
    } else {
      scenarioResult = toResult(((*suite_or.value()).*scenario.run)());
    }
  }
  return result;
}

harness::ScenarioResult SuiteRunner::toResult(const absl::Status& status) {
  harness::ScenarioResult result;
  if (status.ok()) {
    result.set_success(true);
  } else if (IsSkip(status)) {
    *result.mutable_skipped()->mutable_reason() = SkipReason(status);
  } else {
    *result.mutable_failure() = status.ToString(absl::StatusToStringMode::kWithNoExtraData);
    if (auto context = GetFailureContext(status); context.has_value()) {
      *result.mutable_context() = *std::move(context);
    }
  }
  return result;
}

} // namespace ioharness::conformance
