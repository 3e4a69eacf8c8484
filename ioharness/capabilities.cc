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

#include "ioharness/capabilities.h"

#include <algorithm>

namespace ioharness {

Capabilities::Capabilities(const DriverDescriptor& descriptor)
    : supportsLazy_(descriptor.supportsLazy),
      supportsLazyLoad_(descriptor.supportsLazy && descriptor.supportsLazyLoad) {
  for (Kind kind : descriptor.readableKinds) {
    readOrWrite_.push_back(kind);
    if (descriptor.writeableKinds.contains(kind)) {
      readAndWrite_.push_back(kind);
    }
  }
  for (Kind kind : descriptor.writeableKinds) {
    if (!descriptor.readableKinds.contains(kind)) {
      readOrWrite_.push_back(kind);
    }
  }
  std::sort(readAndWrite_.begin(), readAndWrite_.end());
  std::sort(readOrWrite_.begin(), readOrWrite_.end());

  if (!descriptor.supportedKinds.empty()) {
    highest_ = descriptor.supportedKinds.front();
  }
  for (const auto& [kind, params] : descriptor.readParams) {
    if (!params.empty()) {
      needsParams_.insert(kind);
    }
  }
}

bool Capabilities::CanReadAndWrite(Kind kind) const {
  return std::binary_search(readAndWrite_.begin(), readAndWrite_.end(), kind);
}

bool Capabilities::EligibleForGenericRoundTrip(Kind kind) const {
  // Drivers that need external knowledge such as a sampling rate to read a
  // kind cannot be round tripped generically.
  return CanReadAndWrite(kind) && IsContainerRoot(kind) && !needsParams_.contains(kind);
}

} // namespace ioharness
