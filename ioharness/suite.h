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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/message.h"
#include "ioharness/capabilities.h"
#include "ioharness/compliance.h"
#include "ioharness/dispatch.h"
#include "ioharness/driver.h"
#include "ioharness/equivalence.h"
#include "ioharness/fixtures.h"

namespace ioharness {

/// Per driver class configuration of a suite. Every suite holds its own copy.
struct SuiteConfig {
  // Fixtures already present in the local directory.
  std::vector<std::string> filesToTest;
  // Fixtures to download from `baseUrl`.
  std::vector<std::string> filesToDownload;
  // Reading then writing produces files with identical hashes.
  bool hashConservedWhenWriteRead = false;
  // Writing then reading produces an identical object.
  bool readAndWriteIsBijective = true;
  double tolerance = kDefaultTolerance;
  std::string baseUrl = kDefaultFixtureUrl;
};

/// Called for every object read from a fixture.
using ObjectVisitor = std::function<absl::Status(
    const google::protobuf::Message& object, const Fixture& fixture, Driver& driver)>;

/// The conformance scenarios of one driver class.
///
/// SetUp acquires the fixtures and must succeed before any scenario runs.
/// Every scenario returns OK on success, a skip (see IsSkip) if it does not
/// apply to the driver, or a failure annotated with a FailureContext.
class ConformanceSuite {
 public:
  static absl::StatusOr<std::unique_ptr<ConformanceSuite>> New(
      DriverClass driverClass,
      SuiteConfig config,
      HarnessEnvironment environment,
      std::shared_ptr<Fetcher> fetcher = nullptr);

  ConformanceSuite(const ConformanceSuite&) = delete;
  ConformanceSuite& operator=(const ConformanceSuite&) = delete;

  /// Creates the local directory, downloads missing fixtures and generates a
  /// fixture if the driver can write its highest kind.
  ///
  /// A skip means the whole suite is inapplicable; any other error means no
  /// scenario can run.
  absl::Status SetUp();

  /// Writes a generated sample, reads it back through a fresh driver and
  /// compares both objects.
  absl::Status WriteThenRead();

  /// Reads every fixture and writes it back. The byte comparison of the
  /// written files is not performed.
  absl::Status ReadThenWrite();

  /// Every object read from every fixture, eagerly and lazily when supported,
  /// is compliant.
  absl::Status ReadObjectsAreCompliant();

  /// Every object read lazily has empty payloads and records the shape the
  /// eager read produces.
  absl::Status LazyReadIsCompliant();

  /// Loading lazy objects through the driver reproduces the eager read.
  absl::Status LoadLazyObjects();

  /// Reading a fixture twice yields equal objects.
  absl::Status ReadIsIdempotent();

  /// Reads every fixture through `target` and calls `visit` for every object.
  /// Failures are annotated with the fixture and flags.
  absl::Status ForEachObject(
      const Target& target, bool lazy, bool readAll, const ObjectVisitor& visit);

  /// Reads the objects of one fixture through a fresh driver.
  absl::StatusOr<Objects> ReadFixture(
      const Fixture& fixture, const Target& target, bool lazy, bool readAll = false);

  [[nodiscard]] const Capabilities& capabilities() const { return capabilities_; }
  [[nodiscard]] const FixtureSet& fixtures() const { return fixtures_; }
  [[nodiscard]] const SuiteConfig& config() const { return config_; }
  [[nodiscard]] const DriverDescriptor& descriptor() const { return *driverClass_.descriptor; }

 private:
  DriverClass driverClass_;
  SuiteConfig config_;
  Capabilities capabilities_;
  std::shared_ptr<Fetcher> fetcher_;
  FixtureSet fixtures_;
  std::unique_ptr<ComplianceChecker> checker_;

  ConformanceSuite(
      DriverClass driverClass,
      SuiteConfig config,
      HarnessEnvironment environment,
      std::shared_ptr<Fetcher> fetcher,
      std::unique_ptr<ComplianceChecker> checker);

  std::vector<bool> LazyModes() const;
};

} // namespace ioharness
