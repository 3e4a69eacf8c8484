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

#include "ioharness/driver.h"

#include "absl/log/log.h"

namespace ioharness {

const ReadFunc* EntryPointTable::FindReader(std::string_view name, bool readAll) const {
  const auto& table = readAll ? readAll_ : readers_;
  auto iter = table.find(name);
  if (iter == table.end()) {
    return nullptr;
  }
  return &iter->second;
}

const WriteFunc* EntryPointTable::FindWriter(std::string_view name) const {
  auto iter = writers_.find(name);
  if (iter == writers_.end()) {
    return nullptr;
  }
  return &iter->second;
}

ScopedDriver::~ScopedDriver() { CloseQuietly(); }

ScopedDriver& ScopedDriver::operator=(ScopedDriver&& other) noexcept {
  if (this != &other) {
    CloseQuietly();
    driver_ = std::move(other.driver_);
  }
  return *this;
}

absl::Status ScopedDriver::Close() {
  if (driver_ == nullptr) {
    return absl::OkStatus();
  }
  std::unique_ptr<Driver> driver = std::move(driver_);
  return driver->Close();
}

void ScopedDriver::CloseQuietly() {
  if (driver_ == nullptr) {
    return;
  }
  std::string path = driver_->path();
  if (auto status = Close(); !status.ok()) {
    LOG(WARNING) << "failed to close driver for " << path << ": " << status;
  }
}

} // namespace ioharness
