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

#ifndef CACHEGEN_PLUGIN_SELECTOR_H_
#define CACHEGEN_PLUGIN_SELECTOR_H_

#include <string>
#include <string_view>
#include <vector>

#include "google/protobuf/descriptor.h"

#include "cachegen/plugin/model.h"

namespace cachegen::plugin {

constexpr auto kDefaultMarkerSuffix = "Cache";

// Decides which services get a cache manager generated.
//
// A service is selected iff its Go name ends with the marker suffix. The
// comparison is case-sensitive, and a service named exactly as the suffix is
// selected as well.
class ServiceSelector {
 public:
  explicit ServiceSelector(std::string marker_suffix = kDefaultMarkerSuffix);

  bool IsCandidate(std::string_view service_name) const;
  bool IsCandidate(const ServiceModel& service) const;

  // Test if any service in `file` is selected. This works on descriptors
  // directly, so files with nothing to generate are skipped before building a
  // `FileModel` (which requires their Go package to be known).
  bool HasCandidate(const google::protobuf::FileDescriptor* file) const;

  // Selected services, in declaration order.
  std::vector<const ServiceModel*> SelectFrom(const FileModel& file) const;

  const std::string& marker_suffix() const noexcept { return marker_suffix_; }

 private:
  std::string marker_suffix_;
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_SELECTOR_H_
