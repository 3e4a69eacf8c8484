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

#include "ioharness/generate.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"

namespace ioharness {
namespace {

bool Includes(const std::vector<Kind>& include, Kind kind) {
  return std::find(include.begin(), include.end(), kind) != include.end();
}

void FillAnalogSignal(model::AnalogSignal& signal, int index) {
  *signal.mutable_name() = absl::StrCat("signal ", index);
  *signal.mutable_units() = "mV";
  signal.set_sampling_rate(1000.0);
  signal.set_t_start(0.0);
  for (double value : {1.0, 2.0, 3.0}) {
    signal.add_samples(value);
  }
}

void FillSpikeTrain(model::SpikeTrain& train, int index) {
  *train.mutable_name() = absl::StrCat("spiketrain ", index);
  *train.mutable_units() = "s";
  train.set_t_start(0.0);
  train.set_t_stop(10.0);
  for (double time : {0.5, 1.5, 2.5}) {
    train.add_times(time);
  }
}

void FillEvent(model::Event& event, int index) {
  *event.mutable_name() = absl::StrCat("event ", index);
  *event.mutable_units() = "s";
  event.add_times(1.0);
  event.add_labels("start");
  event.add_times(2.0);
  event.add_labels("stop");
}

void FillEpoch(model::Epoch& epoch, int index) {
  *epoch.mutable_name() = absl::StrCat("epoch ", index);
  *epoch.mutable_units() = "s";
  epoch.add_times(0.0);
  epoch.add_durations(1.0);
  epoch.add_labels("rest");
  epoch.add_times(5.0);
  epoch.add_durations(2.0);
  epoch.add_labels("stimulus");
}

void FillSegment(model::Segment& segment, int index, const std::vector<Kind>& include) {
  *segment.mutable_name() = absl::StrCat("segment ", index);
  segment.set_index(index);
  if (Includes(include, model::KIND_ANALOG_SIGNAL)) {
    FillAnalogSignal(*segment.add_analogsignals(), 0);
  }
  if (Includes(include, model::KIND_SPIKE_TRAIN)) {
    FillSpikeTrain(*segment.add_spiketrains(), 0);
  }
  if (Includes(include, model::KIND_EVENT)) {
    FillEvent(*segment.add_events(), 0);
  }
  if (Includes(include, model::KIND_EPOCH)) {
    FillEpoch(*segment.add_epochs(), 0);
  }
}

void FillBlock(model::Block& block, const std::vector<Kind>& include) {
  *block.mutable_name() = "block 0";
  *block.mutable_description() = "generated for conformance testing";
  if (!Includes(include, model::KIND_SEGMENT)) {
    return;
  }
  for (int i = 0; i < 2; i++) {
    FillSegment(*block.add_segments(), i, include);
  }
}

} // namespace

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GenerateObject(
    Kind kind, const std::vector<Kind>& include) {
  switch (kind) {
    case model::KIND_BLOCK: {
      auto block = std::make_unique<model::Block>();
      FillBlock(*block, include);
      return std::move(block);
    }
    case model::KIND_SEGMENT: {
      auto segment = std::make_unique<model::Segment>();
      FillSegment(*segment, 0, include);
      return std::move(segment);
    }
    case model::KIND_ANALOG_SIGNAL: {
      auto signal = std::make_unique<model::AnalogSignal>();
      FillAnalogSignal(*signal, 0);
      return std::move(signal);
    }
    case model::KIND_SPIKE_TRAIN: {
      auto train = std::make_unique<model::SpikeTrain>();
      FillSpikeTrain(*train, 0);
      return std::move(train);
    }
    case model::KIND_EVENT: {
      auto event = std::make_unique<model::Event>();
      FillEvent(*event, 0);
      return std::move(event);
    }
    case model::KIND_EPOCH: {
      auto epoch = std::make_unique<model::Epoch>();
      FillEpoch(*epoch, 0);
      return std::move(epoch);
    }
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("cannot generate an object of kind ", model::Kind_Name(kind)));
  }
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> GenerateFromSupportedKinds(
    const std::vector<Kind>& supportedKinds) {
  if (supportedKinds.empty()) {
    return absl::InvalidArgumentError("no supported kinds to generate from");
  }
  return GenerateObject(supportedKinds.front(), supportedKinds);
}

} // namespace ioharness
