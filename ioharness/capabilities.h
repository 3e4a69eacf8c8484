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

#include <vector>

#include "absl/container/flat_hash_set.h"
#include "ioharness/driver.h"

namespace ioharness {

/// Test eligibility derived from a driver descriptor.
///
/// Capabilities are a pure function of the descriptor they were built from.
class Capabilities {
 public:
  explicit Capabilities(const DriverDescriptor& descriptor);

  /// Kinds that can be both read and written, sorted.
  [[nodiscard]] const std::vector<Kind>& readAndWrite() const { return readAndWrite_; }

  /// Kinds that can be read or written, sorted.
  [[nodiscard]] const std::vector<Kind>& readOrWrite() const { return readOrWrite_; }

  /// The first supported kind, or KIND_UNSPECIFIED.
  [[nodiscard]] Kind highest() const { return highest_; }

  [[nodiscard]] bool supportsLazy() const { return supportsLazy_; }

  /// True if lazy objects read by the driver can be loaded through it.
  [[nodiscard]] bool supportsLazyLoad() const { return supportsLazyLoad_; }

  [[nodiscard]] bool CanReadAndWrite(Kind kind) const;

  /// True if `kind` is a container root that can be read and written without
  /// external parameters.
  [[nodiscard]] bool EligibleForGenericRoundTrip(Kind kind) const;

  /// True if generic writing or reading of the highest kind is possible.
  [[nodiscard]] bool AbleToWriteOrRead() const { return EligibleForGenericRoundTrip(highest_); }

  /// True if writing then reading is possible and expected to reproduce the object.
  [[nodiscard]] bool AbleToWriteThenRead(bool bijective) const {
    return AbleToWriteOrRead() && bijective;
  }

  /// True if reading then writing is possible and expected to reproduce the bytes.
  [[nodiscard]] bool AbleToReadThenWrite(bool hashConserved) const {
    return AbleToWriteOrRead() && hashConserved;
  }

 private:
  std::vector<Kind> readAndWrite_;
  std::vector<Kind> readOrWrite_;
  absl::flat_hash_set<Kind> needsParams_;
  Kind highest_ = model::KIND_UNSPECIFIED;
  bool supportsLazy_ = false;
  bool supportsLazyLoad_ = false;
};

} // namespace ioharness
