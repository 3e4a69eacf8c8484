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

#include "ioharness/fixtures.h"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "ioharness/dispatch.h"
#include "ioharness/status.h"

namespace ioharness {
namespace fs = std::filesystem;

HarnessEnvironment HarnessEnvironment::FromProcess() {
  HarnessEnvironment environment;
  if (const char* root = std::getenv(kFixtureDirEnv); root != nullptr && *root != '\0') {
    environment.fixtureRoot = root;
  }
  if (const char* noNetwork = std::getenv(kNoNetworkEnv);
      noNetwork != nullptr && *noNetwork != '\0') {
    environment.useNetwork = false;
  }
  return environment;
}

absl::Status LocalMirrorFetcher::Fetch(std::string_view url, const std::string& localPath) {
  std::string_view source = url;
  if (!absl::ConsumePrefix(&source, "file://")) {
    return absl::UnimplementedError(absl::StrCat("cannot fetch ", url, ": not a file:// URL"));
  }
  std::error_code ec;
  fs::copy_file(fs::path(std::string(source)), localPath, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return absl::UnavailableError(absl::StrCat("cannot fetch ", url, ": ", ec.message()));
  }
  return absl::OkStatus();
}

std::string_view FixtureOriginName(FixtureOrigin origin) {
  switch (origin) {
    case FixtureOrigin::kSupplied:
      return "supplied";
    case FixtureOrigin::kDownloaded:
      return "downloaded";
    case FixtureOrigin::kGenerated:
      return "generated";
  }
  return "unknown";
}

std::string ShortName(std::string_view driverName) {
  std::string lower = absl::AsciiStrToLower(driverName);
  std::string_view name = lower;
  absl::ConsumeSuffix(&name, "io");
  return std::string(name);
}

absl::StatusOr<std::string> FixtureSet::EnsureLocalDirectory(std::string_view name) {
  std::error_code ec;
  fs::path root;
  if (environment_.fixtureRoot.has_value()) {
    root = *environment_.fixtureRoot;
  } else {
    root = fs::temp_directory_path(ec);
    if (ec) {
      return absl::UnavailableError(
          absl::StrCat("cannot locate the temp directory: ", ec.message()));
    }
  }
  fs::path directory = root / "files_for_testing_ioharness" / std::string(name);
  fs::create_directories(directory, ec);
  if (ec) {
    return absl::UnavailableError(
        absl::StrCat("cannot create ", directory.string(), ": ", ec.message()));
  }
  localDirectory_ = directory.string();
  return localDirectory_;
}

std::string FixtureSet::PathFor(std::string_view filename) const {
  fs::path path(std::string{filename});
  if (path.is_absolute() || localDirectory_.empty()) {
    return path.string();
  }
  return (fs::path(localDirectory_) / path).string();
}

std::string FixtureSet::GeneratedFileName() const {
  const auto& descriptor = *driverClass_.descriptor;
  std::string filename = absl::StrCat("Generated0_", descriptor.name);
  if (descriptor.mode == DriverMode::kFile && !descriptor.extensions.empty()) {
    absl::StrAppend(&filename, ".", descriptor.extensions.front());
  }
  return filename;
}

std::vector<Fixture> FixtureSet::AddSupplied(const std::vector<std::string>& names) {
  std::vector<Fixture> added;
  for (const auto& name : names) {
    added.push_back(Fixture{PathFor(name), FixtureOrigin::kSupplied});
  }
  fixtures_.insert(fixtures_.end(), added.begin(), added.end());
  return added;
}

absl::StatusOr<std::vector<Fixture>> FixtureSet::AcquireDownloaded(
    const std::vector<std::string>& remoteNames, std::string_view baseUrl) {
  std::vector<Fixture> acquired;
  if (remoteNames.empty()) {
    return acquired;
  }
  if (!environment_.useNetwork) {
    return SkipError("requires download of data from the web");
  }
  if (fetcher_ == nullptr) {
    return absl::FailedPreconditionError("no fetcher configured to download fixtures");
  }
  std::string url = absl::StrCat(baseUrl, ShortName(driverClass_.descriptor->name));
  for (const auto& name : remoteNames) {
    std::string localPath = PathFor(name);
    std::error_code ec;
    fs::create_directories(fs::path(localPath).parent_path(), ec);
    if (ec) {
      return absl::UnavailableError(
          absl::StrCat("cannot create the directory of ", localPath, ": ", ec.message()));
    }
    if (!fs::exists(localPath, ec)) {
      std::string remote = absl::StrCat(url, "/", name);
      LOG(INFO) << "downloading " << remote << " to " << localPath;
      if (auto status = fetcher_->Fetch(remote, localPath); !status.ok()) {
        return absl::UnavailableError(
            absl::StrCat("failed to download ", remote, ": ", status.message()));
      }
    }
    acquired.push_back(Fixture{localPath, FixtureOrigin::kDownloaded});
  }
  fixtures_.insert(fixtures_.end(), acquired.begin(), acquired.end());
  return acquired;
}

absl::Status FixtureSet::Cleanup(const std::string& path) const {
  fs::path target(PathFor(path));
  std::error_code statusError;
  fs::file_status status = fs::symlink_status(target, statusError);
  if (status.type() == fs::file_type::not_found) {
    return absl::OkStatus();
  }
  if (statusError) {
    return absl::UnavailableError(
        absl::StrCat("cannot stat ", target.string(), ": ", statusError.message()));
  }
  std::error_code removeError;
  if (driverClass_.descriptor->mode == DriverMode::kFile) {
    if (fs::is_regular_file(status)) {
      fs::remove(target, removeError);
    }
  } else if (fs::is_directory(status)) {
    fs::remove_all(target, removeError);
  }
  if (removeError) {
    return absl::UnavailableError(
        absl::StrCat("cannot remove ", target.string(), ": ", removeError.message()));
  }
  return absl::OkStatus();
}

absl::StatusOr<ScopedDriver> FixtureSet::Open(std::string_view filename, bool clean) const {
  std::string path = PathFor(filename.empty() ? GeneratedFileName() : filename);
  if (clean) {
    if (auto status = Cleanup(path); !status.ok()) {
      return status;
    }
  }
  auto driver_or = driverClass_.factory(path);
  if (!driver_or.ok()) {
    return driver_or.status();
  }
  return ScopedDriver(std::move(driver_or).value());
}

absl::StatusOr<std::vector<Fixture>> FixtureSet::GenerateIfWritable() {
  std::vector<Fixture> generated;
  Capabilities capabilities(*driverClass_.descriptor);
  if (!capabilities.AbleToWriteOrRead()) {
    return generated;
  }
  auto driver_or = Open("", true);
  if (!driver_or.ok()) {
    return driver_or.status();
  }
  ScopedDriver driver = std::move(driver_or).value();
  if (!driver) {
    return generated;
  }
  std::string path = driver->path();
  auto written_or = WriteGeneric(*driver, Target::Of(capabilities.highest()));
  if (!written_or.ok()) {
    return absl::UnavailableError(
        absl::StrCat("failed to generate ", path, ": ", written_or.status().message()));
  }
  if (auto status = driver.Close(); !status.ok()) {
    return absl::UnavailableError(
        absl::StrCat("failed to close ", path, ": ", status.message()));
  }
  LOG(INFO) << "generated " << path;
  generated.push_back(Fixture{path, FixtureOrigin::kGenerated});
  fixtures_.insert(fixtures_.end(), generated.begin(), generated.end());
  return generated;
}

} // namespace ioharness
