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
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "ioharness/capabilities.h"
#include "ioharness/driver.h"

namespace ioharness {

inline constexpr char kFixtureDirEnv[] = "IOHARNESS_TEST_FILE_DIR";
inline constexpr char kNoNetworkEnv[] = "IOHARNESS_NO_NETWORK";
inline constexpr char kDefaultFixtureUrl[] =
    "https://web.gin.g-node.org/NeuralEnsemble/ephy_testing_data/raw/master/";

/// The parts of the process environment the harness depends on.
struct HarnessEnvironment {
  // Root of the local fixture directories. The system temp directory if unset.
  std::optional<std::string> fixtureRoot;
  bool useNetwork = true;

  /// Reads IOHARNESS_TEST_FILE_DIR and IOHARNESS_NO_NETWORK. Any non-empty
  /// value of the latter disables the network.
  static HarnessEnvironment FromProcess();
};

/// Retrieves remote fixtures.
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  /// Stores the resource at `url` in `localPath`.
  virtual absl::Status Fetch(std::string_view url, const std::string& localPath) = 0;
};

/// Fetches file:// URLs by copying from the local file system.
class LocalMirrorFetcher final : public Fetcher {
 public:
  absl::Status Fetch(std::string_view url, const std::string& localPath) override;
};

enum class FixtureOrigin {
  kSupplied,
  kDownloaded,
  kGenerated,
};

struct Fixture {
  std::string path;
  FixtureOrigin origin;
};

std::string_view FixtureOriginName(FixtureOrigin origin);

/// Lower case driver name without its "io" suffix, e.g. "ExampleIO" -> "example".
std::string ShortName(std::string_view driverName);

/// The files a driver class is exercised against.
///
/// Fixtures are kept in registration order: supplied fixtures first, then
/// downloaded ones, then generated ones.
class FixtureSet {
 public:
  FixtureSet(DriverClass driverClass, HarnessEnvironment environment, Fetcher* fetcher)
      : driverClass_(std::move(driverClass)),
        environment_(std::move(environment)),
        fetcher_(fetcher) {}

  /// Creates `<root>/files_for_testing_ioharness/<name>` if needed and makes
  /// it the directory relative fixture names are resolved against.
  absl::StatusOr<std::string> EnsureLocalDirectory(std::string_view name);

  /// Registers fixtures that already exist in the local directory.
  std::vector<Fixture> AddSupplied(const std::vector<std::string>& names);

  /// Downloads the files missing from the local directory from
  /// `<baseUrl><short name>/<remote name>`.
  ///
  /// Returns a skip if the network is disabled and there is something to
  /// download, and an Unavailable error if a download fails.
  absl::StatusOr<std::vector<Fixture>> AcquireDownloaded(
      const std::vector<std::string>& remoteNames, std::string_view baseUrl);

  /// Writes a generated sample of the highest supported kind through the
  /// driver's generic writer.
  ///
  /// Returns no fixture if the highest kind is not eligible for generic round
  /// trips or if the driver class yields no instance.
  absl::StatusOr<std::vector<Fixture>> GenerateIfWritable();

  /// Opens a driver on `filename` in the local directory, or on the generated
  /// file name if `filename` is empty. With `clean`, existing data at the path
  /// is removed first. The returned driver may be empty.
  absl::StatusOr<ScopedDriver> Open(std::string_view filename = "", bool clean = false) const;

  /// Removes a fixture file, or a directory tree for directory drivers.
  absl::Status Cleanup(const std::string& path) const;

  /// Resolves a file name against the local directory.
  [[nodiscard]] std::string PathFor(std::string_view filename) const;

  /// "Generated0_<driver name>[.<first extension>]".
  [[nodiscard]] std::string GeneratedFileName() const;

  [[nodiscard]] const std::vector<Fixture>& fixtures() const { return fixtures_; }

  [[nodiscard]] const std::string& localDirectory() const { return localDirectory_; }

 private:
  DriverClass driverClass_;
  HarnessEnvironment environment_;
  Fetcher* fetcher_;
  std::string localDirectory_;
  std::vector<Fixture> fixtures_;
};

} // namespace ioharness
