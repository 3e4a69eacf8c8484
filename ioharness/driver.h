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
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/message.h"
#include "ioharness/kind.h"

namespace ioharness {

using Objects = std::vector<std::unique_ptr<google::protobuf::Message>>;

enum class DriverMode {
  // The driver reads and writes a single file.
  kFile,
  // The driver reads and writes a directory.
  kDirectory,
};

/// A read or write parameter the driver needs from its caller.
struct Param {
  std::string name;
  std::string defaultValue;
  bool required = false;
};

using ParamMap = absl::flat_hash_map<std::string, Param>;

/// Static capabilities of a driver class.
///
/// Descriptors are populated when the driver class is registered and are not
/// modified afterwards.
struct DriverDescriptor {
  std::string name;
  DriverMode mode = DriverMode::kFile;
  // The first extension names generated files.
  std::vector<std::string> extensions;
  absl::flat_hash_set<Kind> readableKinds;
  absl::flat_hash_set<Kind> writeableKinds;
  // The first kind is the highest kind the driver handles.
  std::vector<Kind> supportedKinds;
  // A non-empty entry means the kind cannot be read without external parameters.
  absl::flat_hash_map<Kind, ParamMap> readParams;
  bool supportsLazy = false;
  // Instances register a lazy loader. Only meaningful with supportsLazy.
  bool supportsLazyLoad = false;
};

struct ReadOptions {
  bool lazy = false;
};

using ReadFunc = std::function<absl::StatusOr<Objects>(const ReadOptions& options)>;
using WriteFunc = std::function<absl::Status(const google::protobuf::Message& object)>;
using LazyLoadFunc = std::function<absl::StatusOr<std::unique_ptr<google::protobuf::Message>>(
    const google::protobuf::Message& lazyObject)>;

/// Kind specific and named entry points of a driver instance.
///
/// Readers are registered twice over: once in the table that reads the primary
/// object and once in the table that reads every object of the kind.
class EntryPointTable {
 public:
  void AddReader(std::string name, ReadFunc reader) {
    readers_.insert_or_assign(std::move(name), std::move(reader));
  }

  void AddReadAll(std::string name, ReadFunc reader) {
    readAll_.insert_or_assign(std::move(name), std::move(reader));
  }

  void AddWriter(std::string name, WriteFunc writer) {
    writers_.insert_or_assign(std::move(name), std::move(writer));
  }

  void SetLazyLoader(LazyLoadFunc loader) { lazyLoader_ = std::move(loader); }

  /// Returns the reader registered under `name`, or null.
  [[nodiscard]] const ReadFunc* FindReader(std::string_view name, bool readAll) const;

  /// Returns the writer registered under `name`, or null.
  [[nodiscard]] const WriteFunc* FindWriter(std::string_view name) const;

  /// Returns the lazy loader, or null if the driver cannot load lazy objects.
  [[nodiscard]] const LazyLoadFunc* lazyLoader() const {
    return lazyLoader_ ? &lazyLoader_ : nullptr;
  }

 private:
  absl::flat_hash_map<std::string, ReadFunc> readers_;
  absl::flat_hash_map<std::string, ReadFunc> readAll_;
  absl::flat_hash_map<std::string, WriteFunc> writers_;
  LazyLoadFunc lazyLoader_;
};

/// A driver instance bound to one path.
///
/// Read and Write are the untyped entry points. Kind specific entry points are
/// registered in the entry point table by the implementation's constructor.
class Driver {
 public:
  virtual ~Driver() = default;

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  /// Reads every top level object in the file.
  virtual absl::StatusOr<Objects> Read(const ReadOptions& options) = 0;

  /// Writes an object of any writeable kind.
  virtual absl::Status Write(const google::protobuf::Message& object) = 0;

  /// Releases the underlying resources. Closing twice is not an error.
  virtual absl::Status Close() = 0;

  [[nodiscard]] const DriverDescriptor& descriptor() const { return *descriptor_; }

  [[nodiscard]] const std::string& path() const { return path_; }

  [[nodiscard]] const EntryPointTable& entryPoints() const { return entryPoints_; }

 protected:
  Driver(std::shared_ptr<const DriverDescriptor> descriptor, std::string path)
      : descriptor_(std::move(descriptor)), path_(std::move(path)) {}

  EntryPointTable entryPoints_;

 private:
  std::shared_ptr<const DriverDescriptor> descriptor_;
  std::string path_;
};

/// Creates a driver for a path. A null driver means the class cannot be
/// instantiated for this path.
using DriverFactory =
    std::function<absl::StatusOr<std::unique_ptr<Driver>>(const std::string& path)>;

/// A registered driver class.
struct DriverClass {
  std::shared_ptr<const DriverDescriptor> descriptor;
  DriverFactory factory;
};

/// Owns a driver and closes it when going out of scope.
class ScopedDriver {
 public:
  ScopedDriver() = default;
  explicit ScopedDriver(std::unique_ptr<Driver> driver) : driver_(std::move(driver)) {}
  ~ScopedDriver();

  // Move only.
  ScopedDriver(const ScopedDriver&) = delete;
  ScopedDriver& operator=(const ScopedDriver&) = delete;
  ScopedDriver(ScopedDriver&&) = default;
  ScopedDriver& operator=(ScopedDriver&& other) noexcept;

  /// Closes the driver now and reports the result.
  absl::Status Close();

  [[nodiscard]] Driver* get() const { return driver_.get(); }
  Driver* operator->() const { return driver_.get(); }
  Driver& operator*() const { return *driver_; }
  explicit operator bool() const { return driver_ != nullptr; }

 private:
  std::unique_ptr<Driver> driver_;

  void CloseQuietly();
};

} // namespace ioharness
