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

#include "ioharness/equivalence.h"

#include "absl/strings/str_cat.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/util/field_comparator.h"
#include "google/protobuf/util/message_differencer.h"

namespace ioharness {

bool StructurallyEqual(
    const google::protobuf::Message& a,
    const google::protobuf::Message& b,
    double tolerance,
    std::string* differences) {
  if (a.GetDescriptor() != b.GetDescriptor()) {
    if (differences != nullptr) {
      *differences = absl::StrCat(
          "type mismatch: ",
          a.GetDescriptor()->full_name(),
          " vs ",
          b.GetDescriptor()->full_name());
    }
    return false;
  }
  google::protobuf::util::DefaultFieldComparator comparator;
  comparator.set_float_comparison(google::protobuf::util::DefaultFieldComparator::APPROXIMATE);
  comparator.SetDefaultFractionAndMargin(0.0, tolerance);
  comparator.set_treat_nan_as_equal(true);

  google::protobuf::util::MessageDifferencer differencer;
  differencer.set_field_comparator(&comparator);
  if (differences != nullptr) {
    differencer.ReportDifferencesToString(differences);
  }
  return differencer.Compare(a, b);
}

absl::Status AssertStructurallyEqual(
    const google::protobuf::Message& expected,
    const google::protobuf::Message& actual,
    double tolerance) {
  std::string differences;
  if (StructurallyEqual(expected, actual, tolerance, &differences)) {
    return absl::OkStatus();
  }
  return absl::InternalError(absl::StrCat(
      expected.GetDescriptor()->name(), " objects differ at tolerance ", tolerance, ": ",
      differences));
}

} // namespace ioharness
