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

#include "ioharness/suite.h"

#include <filesystem>
#include <utility>

#include "absl/strings/str_cat.h"
#include "ioharness/lazy.h"
#include "ioharness/status.h"

namespace ioharness {
namespace {

constexpr char kWriteThenRead[] = "write_then_read";
constexpr char kReadThenWrite[] = "read_then_write";
constexpr char kReadCompliant[] = "read_objects_are_compliant";
constexpr char kLazyCompliant[] = "lazy_read_is_compliant";
constexpr char kLoadLazy[] = "load_lazy_objects";
constexpr char kIdempotent[] = "read_is_idempotent";

harness::FailureContext FixtureContext(
    std::string_view scenario, const std::string& path, bool lazy, bool readAll) {
  harness::FailureContext context;
  *context.mutable_scenario() = scenario;
  *context.mutable_fixture() = std::filesystem::path(path).filename().string();
  context.set_lazy(lazy);
  context.set_read_all(readAll);
  return context;
}

harness::FailureContext ObjectContext(std::string_view object, double tolerance) {
  harness::FailureContext context;
  *context.mutable_object() = object;
  context.set_tolerance(tolerance);
  return context;
}

} // namespace

ConformanceSuite::ConformanceSuite(
    DriverClass driverClass,
    SuiteConfig config,
    HarnessEnvironment environment,
    std::shared_ptr<Fetcher> fetcher,
    std::unique_ptr<ComplianceChecker> checker)
    : driverClass_(std::move(driverClass)),
      config_(std::move(config)),
      capabilities_(*driverClass_.descriptor),
      fetcher_(std::move(fetcher)),
      fixtures_(driverClass_, std::move(environment), fetcher_.get()),
      checker_(std::move(checker)) {}

absl::StatusOr<std::unique_ptr<ConformanceSuite>> ConformanceSuite::New(
    DriverClass driverClass,
    SuiteConfig config,
    HarnessEnvironment environment,
    std::shared_ptr<Fetcher> fetcher) {
  if (driverClass.descriptor == nullptr || !driverClass.factory) {
    return absl::InvalidArgumentError("driver class needs a descriptor and a factory");
  }
  auto checker_or = ComplianceChecker::New();
  if (!checker_or.ok()) {
    return checker_or.status();
  }
  return std::unique_ptr<ConformanceSuite>(new ConformanceSuite(
      std::move(driverClass),
      std::move(config),
      std::move(environment),
      std::move(fetcher),
      std::move(checker_or).value()));
}

std::vector<bool> ConformanceSuite::LazyModes() const {
  if (capabilities_.supportsLazy()) {
    return {false, true};
  }
  return {false};
}

absl::Status ConformanceSuite::SetUp() {
  if (auto dir_or = fixtures_.EnsureLocalDirectory(ShortName(descriptor().name)); !dir_or.ok()) {
    return dir_or.status();
  }
  fixtures_.AddSupplied(config_.filesToTest);
  if (auto downloaded_or = fixtures_.AcquireDownloaded(config_.filesToDownload, config_.baseUrl);
      !downloaded_or.ok()) {
    return downloaded_or.status();
  }
  if (auto generated_or = fixtures_.GenerateIfWritable(); !generated_or.ok()) {
    return generated_or.status();
  }
  return absl::OkStatus();
}

absl::StatusOr<Objects> ConformanceSuite::ReadFixture(
    const Fixture& fixture, const Target& target, bool lazy, bool readAll) {
  auto driver_or = fixtures_.Open(fixture.path);
  if (!driver_or.ok()) {
    return driver_or.status();
  }
  ScopedDriver driver = std::move(driver_or).value();
  if (!driver) {
    return absl::InternalError(
        absl::StrCat("driver ", descriptor().name, " yields no instance for ", fixture.path));
  }
  auto objects_or = ReadGeneric(*driver, target, lazy, readAll);
  if (!objects_or.ok()) {
    return objects_or.status();
  }
  if (auto status = driver.Close(); !status.ok()) {
    return status;
  }
  return objects_or;
}

absl::Status ConformanceSuite::ForEachObject(
    const Target& target, bool lazy, bool readAll, const ObjectVisitor& visit) {
  for (const auto& fixture : fixtures_.fixtures()) {
    auto context = FixtureContext("", fixture.path, lazy, readAll);
    auto driver_or = fixtures_.Open(fixture.path);
    if (!driver_or.ok()) {
      return AnnotateFailure(driver_or.status(), context);
    }
    ScopedDriver driver = std::move(driver_or).value();
    if (!driver) {
      return AnnotateFailure(absl::InternalError("driver class yields no instance"), context);
    }
    auto objects_or = ReadGeneric(*driver, target, lazy, readAll);
    if (!objects_or.ok()) {
      return AnnotateFailure(objects_or.status(), context);
    }
    for (const auto& object : *objects_or) {
      if (auto status = visit(*object, fixture, *driver); !status.ok()) {
        return AnnotateFailure(status, context);
      }
    }
    if (auto status = driver.Close(); !status.ok()) {
      return AnnotateFailure(status, context);
    }
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::WriteThenRead() {
  if (!config_.readAndWriteIsBijective) {
    return SkipError(absl::StrCat(descriptor().name, " does not reproduce written objects"));
  }
  if (!capabilities_.AbleToWriteThenRead(config_.readAndWriteIsBijective)) {
    return SkipError(absl::StrCat(
        descriptor().name,
        " cannot round trip its highest kind ",
        model::Kind_Name(capabilities_.highest()),
        " generically"));
  }
  auto writer_or = fixtures_.Open("", true);
  if (!writer_or.ok()) {
    return writer_or.status();
  }
  ScopedDriver writer = std::move(writer_or).value();
  if (!writer) {
    return SkipError(absl::StrCat(descriptor().name, " yields no driver instance"));
  }
  std::string path = writer->path();
  auto context = FixtureContext(kWriteThenRead, path, false, false);

  auto written_or = WriteGeneric(*writer, Target::Of(capabilities_.highest()));
  if (!written_or.ok()) {
    return AnnotateFailure(written_or.status(), context);
  }
  if (auto status = writer.Close(); !status.ok()) {
    return AnnotateFailure(status, context);
  }
  const google::protobuf::Message& written = **written_or;

  auto reader_or = fixtures_.Open(path);
  if (!reader_or.ok()) {
    return AnnotateFailure(reader_or.status(), context);
  }
  ScopedDriver reader = std::move(reader_or).value();
  if (!reader) {
    return AnnotateFailure(absl::InternalError("driver class yields no instance"), context);
  }
  auto objects_or = ReadGeneric(*reader, Target::Untyped());
  if (!objects_or.ok()) {
    return AnnotateFailure(objects_or.status(), context);
  }
  if (objects_or->empty()) {
    return AnnotateFailure(absl::InternalError("reading back returned no object"), context);
  }
  const google::protobuf::Message* read = objects_or->front().get();
  // The untyped reader returns the top level root even if a segment was written.
  if (capabilities_.highest() == model::KIND_SEGMENT && KindOf(*read) == model::KIND_BLOCK) {
    const auto& block = static_cast<const model::Block&>(*read);
    if (block.segments_size() == 0) {
      return AnnotateFailure(
          absl::InternalError("reading back returned a block without segments"), context);
    }
    read = &block.segments(0);
  }

  if (auto status = AssertStructurallyEqual(written, *read, config_.tolerance); !status.ok()) {
    return AnnotateFailure(
        AnnotateFailure(status, ObjectContext("read", config_.tolerance)), context);
  }
  if (auto status = checker_->AssertCompliant(written); !status.ok()) {
    return AnnotateFailure(
        AnnotateFailure(status, ObjectContext("written", config_.tolerance)), context);
  }
  if (auto status = checker_->AssertCompliant(*read); !status.ok()) {
    return AnnotateFailure(
        AnnotateFailure(status, ObjectContext("read", config_.tolerance)), context);
  }
  if (auto status = reader.Close(); !status.ok()) {
    return AnnotateFailure(status, context);
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::ReadThenWrite() {
  if (!capabilities_.AbleToReadThenWrite(config_.hashConservedWhenWriteRead)) {
    return SkipError(
        absl::StrCat(descriptor().name, " does not declare hash conservation"));
  }
  // TODO: compare the hashes of the source and rewritten files once the
  // byte-equality semantics of each format are settled.
  int index = 0;
  for (const auto& fixture : fixtures_.fixtures()) {
    auto context = FixtureContext(kReadThenWrite, fixture.path, false, false);
    auto objects_or = ReadFixture(fixture, Target::Highest(), false);
    if (!objects_or.ok()) {
      return AnnotateFailure(objects_or.status(), context);
    }
    for (const auto& object : *objects_or) {
      std::string filename = absl::StrCat("Rewritten", index++, "_", fixtures_.GeneratedFileName());
      auto writer_or = fixtures_.Open(filename, true);
      if (!writer_or.ok()) {
        return AnnotateFailure(writer_or.status(), context);
      }
      ScopedDriver writer = std::move(writer_or).value();
      if (!writer) {
        return AnnotateFailure(absl::InternalError("driver class yields no instance"), context);
      }
      if (auto written_or = WriteGeneric(*writer, Target::Highest(), object.get());
          !written_or.ok()) {
        return AnnotateFailure(written_or.status(), context);
      }
      if (auto status = writer.Close(); !status.ok()) {
        return AnnotateFailure(status, context);
      }
      if (auto status = fixtures_.Cleanup(filename); !status.ok()) {
        return AnnotateFailure(status, context);
      }
    }
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::ReadObjectsAreCompliant() {
  for (bool lazy : LazyModes()) {
    auto status = ForEachObject(
        Target::Highest(),
        lazy,
        false,
        [this](const google::protobuf::Message& object, const Fixture&, Driver&) {
          return checker_->AssertCompliant(object);
        });
    if (!status.ok()) {
      harness::FailureContext context;
      *context.mutable_scenario() = kReadCompliant;
      return AnnotateFailure(status, context);
    }
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::LazyReadIsCompliant() {
  if (!capabilities_.supportsLazy()) {
    return SkipError(absl::StrCat(descriptor().name, " does not support lazy reads"));
  }
  for (const auto& fixture : fixtures_.fixtures()) {
    auto context = FixtureContext(kLazyCompliant, fixture.path, true, false);
    auto lazy_or = ReadFixture(fixture, Target::Highest(), true);
    if (!lazy_or.ok()) {
      return AnnotateFailure(lazy_or.status(), context);
    }
    auto eager_or = ReadFixture(fixture, Target::Highest(), false);
    if (!eager_or.ok()) {
      return AnnotateFailure(eager_or.status(), context);
    }
    if (lazy_or->size() != eager_or->size()) {
      return AnnotateFailure(
          absl::InternalError(absl::StrCat(
              "lazy read returned ",
              lazy_or->size(),
              " objects, eager read returned ",
              eager_or->size())),
          context);
    }
    for (size_t i = 0; i < lazy_or->size(); i++) {
      if (auto status = checker_->AssertLazyCompliant(*(*lazy_or)[i]); !status.ok()) {
        return AnnotateFailure(status, context);
      }
      if (auto status = AssertLazyShapesMatch(*(*lazy_or)[i], *(*eager_or)[i]); !status.ok()) {
        return AnnotateFailure(status, context);
      }
    }
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::LoadLazyObjects() {
  if (!capabilities_.supportsLazy()) {
    return SkipError(absl::StrCat(descriptor().name, " does not support lazy reads"));
  }
  if (!capabilities_.supportsLazyLoad()) {
    return SkipError(absl::StrCat(descriptor().name, " cannot load lazy objects"));
  }
  for (const auto& fixture : fixtures_.fixtures()) {
    auto context = FixtureContext(kLoadLazy, fixture.path, true, false);
    auto driver_or = fixtures_.Open(fixture.path);
    if (!driver_or.ok()) {
      return AnnotateFailure(driver_or.status(), context);
    }
    ScopedDriver driver = std::move(driver_or).value();
    if (!driver) {
      return AnnotateFailure(absl::InternalError("driver class yields no instance"), context);
    }
    const LazyLoadFunc* loader = driver->entryPoints().lazyLoader();
    if (loader == nullptr) {
      return AnnotateFailure(
          absl::InternalError("driver declares lazy loading but registers no lazy loader"),
          context);
    }
    auto lazy_or = ReadGeneric(*driver, Target::Highest(), true);
    if (!lazy_or.ok()) {
      return AnnotateFailure(lazy_or.status(), context);
    }
    auto eager_or = ReadFixture(fixture, Target::Highest(), false);
    if (!eager_or.ok()) {
      return AnnotateFailure(eager_or.status(), context);
    }
    if (lazy_or->size() != eager_or->size()) {
      return AnnotateFailure(
          absl::InternalError("lazy and eager reads returned different object counts"), context);
    }
    for (size_t i = 0; i < lazy_or->size(); i++) {
      auto status =
          AssertLazyObjectsCanBeLoaded(*(*lazy_or)[i], *(*eager_or)[i], *loader, config_.tolerance);
      if (!status.ok()) {
        return AnnotateFailure(status, context);
      }
    }
    if (auto status = driver.Close(); !status.ok()) {
      return AnnotateFailure(status, context);
    }
  }
  return absl::OkStatus();
}

absl::Status ConformanceSuite::ReadIsIdempotent() {
  for (bool lazy : LazyModes()) {
    for (const auto& fixture : fixtures_.fixtures()) {
      auto context = FixtureContext(kIdempotent, fixture.path, lazy, false);
      auto first_or = ReadFixture(fixture, Target::Highest(), lazy);
      if (!first_or.ok()) {
        return AnnotateFailure(first_or.status(), context);
      }
      auto second_or = ReadFixture(fixture, Target::Highest(), lazy);
      if (!second_or.ok()) {
        return AnnotateFailure(second_or.status(), context);
      }
      if (first_or->size() != second_or->size()) {
        return AnnotateFailure(
            absl::InternalError("repeated reads returned different object counts"), context);
      }
      for (size_t i = 0; i < first_or->size(); i++) {
        auto status =
            AssertStructurallyEqual(*(*first_or)[i], *(*second_or)[i], config_.tolerance);
        if (!status.ok()) {
          return AnnotateFailure(status, context);
        }
      }
    }
  }
  return absl::OkStatus();
}

} // namespace ioharness
