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

#include "cachegen/plugin/manager_decl_generator.h"

#include <string>
#include <utility>

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"
#include "cachegen/plugin/comments.h"
#include "cachegen/plugin/names.h"

namespace cachegen::plugin {

namespace {

// Exported by the runtime.
constexpr auto kCacheHandleType = "CacheManager";
constexpr auto kCacheHandleConstructor = "NewCacheManager";
constexpr auto kCacheOptionType = "CacheOption";
constexpr auto kFetchOperation = "Get";
constexpr auto kRefreshOperation = "Refresh";

const GoIdent kContext = {"context", "Context"};
const GoIdent kErrorf = {"fmt", "Errorf"};

}  // namespace

ManagerDeclGenerator::ManagerDeclGenerator(std::string runtime_import_path)
    : runtime_import_path_(std::move(runtime_import_path)) {}

void ManagerDeclGenerator::GenerateService(const ServiceModel& service,
                                           GeneratedFile* file) const {
  CACHEGEN_CHECK(!service.name().empty());
  CACHEGEN_VLOG(1, "Generating [{}] with [{}] method(s) into [{}].",
                GetManagerName(service.name()), service.methods().size(),
                file->filename());

  GenerateType(service, file);
  GenerateConstructor(service, file);
  GenerateMethods(service, file);
}

void ManagerDeclGenerator::GenerateType(const ServiceModel& service,
                                        GeneratedFile* file) const {
  auto manager = GetManagerName(service.name());
  auto handle = file->QualifiedGoIdent(RuntimeIdent(kCacheHandleType));

  std::string fields;
  for (auto&& method : service.methods()) {
    fields += Format("\t{field} *{handle}[*{input_type}, *{output_type}]\n",
                     fmt::arg("field", GetCacheFieldName(service.name(),
                                                         method->name)),
                     fmt::arg("handle", handle),
                     fmt::arg("input_type",
                              file->QualifiedGoIdent(method->input)),
                     fmt::arg("output_type",
                              file->QualifiedGoIdent(method->output)));
  }
  file->Append(Format(
      "{comment}"
      "type {manager} struct {{\n"
      "{fields}"
      "}}\n",
      fmt::arg("comment",
               GetManagerTypeComment(manager, service.leading_comments())),
      fmt::arg("manager", manager), fmt::arg("fields", fields)));
}

void ManagerDeclGenerator::GenerateConstructor(const ServiceModel& service,
                                               GeneratedFile* file) const {
  auto manager = GetManagerName(service.name());
  auto constructor = GetConstructorName(service.name());

  // One update function per method, the runtime calls it on cache miss (or
  // refresh).
  std::string params;
  // Caches are built in declaration order. The first failure is returned, and
  // nothing built so far escapes.
  std::string constructions;
  // Fields of the resulting manager.
  std::string assignments;

  for (auto&& method : service.methods()) {
    auto field = GetCacheFieldName(service.name(), method->name);
    auto input_type = file->QualifiedGoIdent(method->input);
    auto output_type = file->QualifiedGoIdent(method->output);
    auto update_fn = GetUpdateFnParamName(method->name);

    params += Format(
        "\t{update_fn} func({context}, *{input_type}) (*{output_type}, "
        "error),\n",
        fmt::arg("update_fn", update_fn),
        fmt::arg("context", file->QualifiedGoIdent(kContext)),
        fmt::arg("input_type", input_type),
        fmt::arg("output_type", output_type));
    constructions += Format(
        "\t{field}, err := {new_handle}[*{input_type}, *{output_type}](\n"
        "\t\t\"{cache_name}\",\n"
        "\t\tfunc() *{output_type} {{ return &{output_type}{{}} }},\n"
        "\t\t{update_fn},\n"
        "\t\toptions...,\n"
        "\t)\n"
        "\tif err != nil {{\n"
        "\t\treturn nil, {errorf}(\"creating cache manager %s: %w\", "
        "\"{method}\", err)\n"
        "\t}}\n"
        "\n",
        fmt::arg("field", field),
        fmt::arg("new_handle",
                 file->QualifiedGoIdent(RuntimeIdent(kCacheHandleConstructor))),
        fmt::arg("input_type", input_type),
        fmt::arg("output_type", output_type),
        fmt::arg("cache_name", GetCacheName(method->name)),
        fmt::arg("update_fn", update_fn),
        fmt::arg("errorf", file->QualifiedGoIdent(kErrorf)),
        fmt::arg("method", method->name));
    assignments += Format("\t\t{field}: {field},\n", fmt::arg("field", field));
  }
  if (!assignments.empty()) {
    assignments = "\n" + assignments + "\t";
  }

  file->Append(Format(
      "{comment}"
      "func {constructor}(\n"
      "{params}"
      "\toptions ...{option_type},\n"
      ") (*{manager}, error) {{\n"
      "{constructions}"
      "\treturn &{manager}{{{assignments}}}, nil\n"
      "}}\n",
      fmt::arg("comment",
               GetConstructorComment(constructor, service.leading_comments())),
      fmt::arg("constructor", constructor), fmt::arg("params", params),
      fmt::arg("option_type",
               file->QualifiedGoIdent(RuntimeIdent(kCacheOptionType))),
      fmt::arg("manager", manager),
      fmt::arg("constructions", constructions),
      fmt::arg("assignments", assignments)));
}

void ManagerDeclGenerator::GenerateMethods(const ServiceModel& service,
                                           GeneratedFile* file) const {
  // Both wrappers look the same except for their names and the runtime
  // operation they delegate to.
  constexpr auto kPattern =
      "{comment}"
      "func (cm *{manager}) {wrapper}(\n"
      "\tctx {context},\n"
      "\tinput *{input_type},\n"
      ") (*{output_type}, error) {{\n"
      "\treturn cm.{field}.{operation}(ctx, input)\n"
      "}}\n";

  auto manager = GetManagerName(service.name());
  for (auto&& method : service.methods()) {
    CACHEGEN_DCHECK(method->parent == &service);
    auto field = GetCacheFieldName(service.name(), method->name);
    auto context = file->QualifiedGoIdent(kContext);
    auto input_type = file->QualifiedGoIdent(method->input);
    auto output_type = file->QualifiedGoIdent(method->output);

    file->Append(Format(
        kPattern,
        fmt::arg("comment", GetFetchMethodComment(method->leading_comments)),
        fmt::arg("manager", manager),
        fmt::arg("wrapper", GetFetchMethodName(method->name)),
        fmt::arg("context", context), fmt::arg("input_type", input_type),
        fmt::arg("output_type", output_type), fmt::arg("field", field),
        fmt::arg("operation", kFetchOperation)));
    file->Append(Format(
        kPattern,
        fmt::arg("comment", GetRefreshMethodComment(method->leading_comments)),
        fmt::arg("manager", manager),
        fmt::arg("wrapper", GetRefreshMethodName(method->name)),
        fmt::arg("context", context), fmt::arg("input_type", input_type),
        fmt::arg("output_type", output_type), fmt::arg("field", field),
        fmt::arg("operation", kRefreshOperation)));
  }
}

GoIdent ManagerDeclGenerator::RuntimeIdent(const char* name) const {
  return GoIdent{runtime_import_path_, name};
}

}  // namespace cachegen::plugin
