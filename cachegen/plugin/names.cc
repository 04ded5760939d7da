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

#include "cachegen/plugin/names.h"

#include <string>

#include "cachegen/base/string.h"

namespace cachegen::plugin {

std::string GetManagerName(std::string_view service) {
  if (service.empty()) {
    return {};
  }
  return std::string(service) + "Manager";
}

std::string GetPrivateFieldName(std::string_view manager) {
  std::string result(manager);
  if (!result.empty()) {
    result.front() = ToLower(result.front());
  }
  return result;
}

std::string GetCompositeFieldName(std::string_view private_name,
                                  std::string_view method) {
  return Format("{}_{}", private_name, method);
}

std::string GetCacheFieldName(std::string_view service,
                              std::string_view method) {
  return GetCompositeFieldName(GetPrivateFieldName(GetManagerName(service)),
                               method);
}

std::string GetConstructorName(std::string_view service) {
  return "New" + GetManagerName(service);
}

std::string GetUpdateFnParamName(std::string_view method) {
  return Format("update{}Fn", method);
}

std::string GetFetchMethodName(std::string_view method) {
  return "Get" + std::string(method);
}

std::string GetRefreshMethodName(std::string_view method) {
  return "Refresh" + std::string(method);
}

std::string GetCacheName(std::string_view method) { return ToLower(method); }

}  // namespace cachegen::plugin
