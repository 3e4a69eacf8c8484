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

#include "ioharness/dispatch.h"

#include "absl/strings/str_cat.h"
#include "ioharness/generate.h"

namespace ioharness {

absl::StatusOr<std::string> Target::EntryName(const Driver& driver) const {
  if (isUntyped()) {
    return std::string();
  }
  if (const auto* name = std::get_if<std::string>(&value_)) {
    return *name;
  }
  Kind kind = model::KIND_UNSPECIFIED;
  if (const auto* explicitKind = std::get_if<Kind>(&value_)) {
    kind = *explicitKind;
  } else {
    const auto& supported = driver.descriptor().supportedKinds;
    if (supported.empty()) {
      return absl::NotFoundError(
          absl::StrCat("driver ", driver.descriptor().name, " declares no supported kinds"));
    }
    kind = supported.front();
  }
  if (KindDescriptor(kind) == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("no entry point for kind ", model::Kind_Name(kind)));
  }
  return KindName(kind);
}

std::string Target::DebugString() const {
  if (isHighest()) {
    return "highest";
  }
  if (isUntyped()) {
    return "untyped";
  }
  if (const auto* kind = std::get_if<Kind>(&value_)) {
    return absl::StrCat("kind ", model::Kind_Name(*kind));
  }
  return absl::StrCat("name ", std::get<std::string>(value_));
}

absl::StatusOr<Reader> ResolveReader(Driver& driver, const Target& target, bool lazy, bool readAll) {
  ReadOptions options;
  options.lazy = lazy;
  if (target.isUntyped()) {
    return Reader([&driver, options]() { return driver.Read(options); });
  }
  auto name_or = target.EntryName(driver);
  if (!name_or.ok()) {
    return name_or.status();
  }
  const ReadFunc* reader = driver.entryPoints().FindReader(*name_or, readAll);
  if (reader == nullptr) {
    return absl::NotFoundError(absl::StrCat(
        "driver ",
        driver.descriptor().name,
        " has no ",
        readAll ? "read_all_" : "read_",
        *name_or,
        " entry point"));
  }
  return Reader([reader, options]() { return (*reader)(options); });
}

absl::StatusOr<Writer> ResolveWriter(Driver& driver, const Target& target) {
  if (target.isUntyped()) {
    return Writer([&driver](const google::protobuf::Message& object) {
      return driver.Write(object);
    });
  }
  auto name_or = target.EntryName(driver);
  if (!name_or.ok()) {
    return name_or.status();
  }
  const WriteFunc* writer = driver.entryPoints().FindWriter(*name_or);
  if (writer == nullptr) {
    return absl::NotFoundError(absl::StrCat(
        "driver ", driver.descriptor().name, " has no write_", *name_or, " entry point"));
  }
  return Writer(*writer);
}

absl::StatusOr<Objects> ReadGeneric(Driver& driver, const Target& target, bool lazy, bool readAll) {
  auto reader_or = ResolveReader(driver, target, lazy, readAll);
  if (!reader_or.ok()) {
    return reader_or.status();
  }
  return (*reader_or)();
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> WriteGeneric(
    Driver& driver, const Target& target, const google::protobuf::Message* object) {
  auto writer_or = ResolveWriter(driver, target);
  if (!writer_or.ok()) {
    return writer_or.status();
  }
  std::unique_ptr<google::protobuf::Message> written;
  if (object == nullptr) {
    auto generated_or = GenerateFromSupportedKinds(driver.descriptor().supportedKinds);
    if (!generated_or.ok()) {
      return generated_or.status();
    }
    written = std::move(generated_or).value();
  } else {
    written = CloneObject(*object);
  }
  if (auto status = (*writer_or)(*written); !status.ok()) {
    return status;
  }
  return written;
}

} // namespace ioharness
