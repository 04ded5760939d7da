// Copyright (C) 2026 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#include "cachegen/plugin/selector.h"

#include <string>
#include <utility>
#include <vector>

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"
#include "cachegen/plugin/go_names.h"

namespace cachegen::plugin {

ServiceSelector::ServiceSelector(std::string marker_suffix)
    : marker_suffix_(std::move(marker_suffix)) {
  CACHEGEN_CHECK(!marker_suffix_.empty(), "Marker suffix may not be empty.");
}

bool ServiceSelector::IsCandidate(std::string_view service_name) const {
  return EndsWith(service_name, marker_suffix_);
}

bool ServiceSelector::IsCandidate(const ServiceModel& service) const {
  return IsCandidate(service.name());
}

bool ServiceSelector::HasCandidate(
    const google::protobuf::FileDescriptor* file) const {
  for (int i = 0; i != file->service_count(); ++i) {
    if (IsCandidate(GoCamelCase(file->service(i)->name()))) {
      return true;
    }
  }
  return false;
}

std::vector<const ServiceModel*> ServiceSelector::SelectFrom(
    const FileModel& file) const {
  std::vector<const ServiceModel*> selected;
  for (auto&& service : file.services()) {
    if (IsCandidate(*service)) {
      selected.push_back(service.get());
    } else {
      CACHEGEN_VLOG(1, "Skipping service [{}] in [{}], not suffixed by [{}].",
                    service->name(), file.proto_path(), marker_suffix_);
    }
  }
  return selected;
}

}  // namespace cachegen::plugin
