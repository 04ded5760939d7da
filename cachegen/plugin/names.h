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

#ifndef CACHEGEN_PLUGIN_NAMES_H_
#define CACHEGEN_PLUGIN_NAMES_H_

#include <string>
#include <string_view>

// Mangles names used in generated code. All of them are pure functions on
// Go identifiers.

namespace cachegen::plugin {

// `OrderCache` -> `OrderCacheManager`. Empty name is mapped to empty name.
std::string GetManagerName(std::string_view service);

// `OrderCacheManager` -> `orderCacheManager`.
std::string GetPrivateFieldName(std::string_view manager);

// (`orderCacheManager`, `GetOrder`) -> `orderCacheManager_GetOrder`. This names
// both the struct field and the local variable in the constructor.
std::string GetCompositeFieldName(std::string_view private_name,
                                  std::string_view method);

// Shorthand for the three above.
std::string GetCacheFieldName(std::string_view service,
                              std::string_view method);

// `OrderCache` -> `NewOrderCacheManager`.
std::string GetConstructorName(std::string_view service);

// `GetOrder` -> `updateGetOrderFn`.
std::string GetUpdateFnParamName(std::string_view method);

// `GetOrder` -> `GetGetOrder` (fetch through cache).
std::string GetFetchMethodName(std::string_view method);

// `GetOrder` -> `RefreshGetOrder` (force refresh).
std::string GetRefreshMethodName(std::string_view method);

// `GetOrder` -> `getorder`, logical name of the cache handed to the runtime.
std::string GetCacheName(std::string_view method);

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_NAMES_H_
