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

#ifndef CACHEGEN_PLUGIN_MANAGER_DECL_GENERATOR_H_
#define CACHEGEN_PLUGIN_MANAGER_DECL_GENERATOR_H_

#include <string>

#include "cachegen/plugin/generated_file.h"
#include "cachegen/plugin/model.h"

namespace cachegen::plugin {

// This class generates cache manager of a service.
//
// For service `OrderCache` with method `GetOrder(OrderReq) returns
// (OrderResp)`, we generate:
//
// - `type OrderCacheManager struct`, holding one
//   `*CacheManager[*OrderReq, *OrderResp]` per method.
//
// - `func NewOrderCacheManager(updateGetOrderFn ..., options ...CacheOption)`,
//   which builds a cache per method, and fails on the first one that can't be
//   built.
//
// - `GetGetOrder` / `RefreshGetOrder`, delegating to `Get` / `Refresh` of the
//   corresponding cache.
//
// Caching itself is done by the runtime at `runtime_import_path`.
class ManagerDeclGenerator {
 public:
  explicit ManagerDeclGenerator(std::string runtime_import_path);

  // All of the declarations below, in that order.
  void GenerateService(const ServiceModel& service, GeneratedFile* file) const;

  void GenerateType(const ServiceModel& service, GeneratedFile* file) const;
  void GenerateConstructor(const ServiceModel& service,
                           GeneratedFile* file) const;

  // `Get<Method>` and `Refresh<Method>` for each method.
  void GenerateMethods(const ServiceModel& service, GeneratedFile* file) const;

 private:
  GoIdent RuntimeIdent(const char* name) const;

 private:
  std::string runtime_import_path_;
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_MANAGER_DECL_GENERATOR_H_
