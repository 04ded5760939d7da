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

#ifndef CACHEGEN_PLUGIN_CACHE_MANAGER_GENERATOR_H_
#define CACHEGEN_PLUGIN_CACHE_MANAGER_GENERATOR_H_

#include <cstdint>
#include <memory>
#include <string>

#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/descriptor.h"

#include "cachegen/base/status.h"
#include "cachegen/plugin/code_writer.h"
#include "cachegen/plugin/generated_file.h"
#include "cachegen/plugin/model.h"
#include "cachegen/plugin/selector.h"

namespace cachegen::plugin {

// `<prefix>_cache_manager.pb.go`
std::string GetCacheManagerFilename(const FileModel& model);

// Generates cache managers for services in `model` selected by `selector`, in
// declaration order.
//
// Returns `nullptr` if no service is selected, no file should be written in
// this case.
std::unique_ptr<GeneratedFile> GenerateCacheManagerFile(
    const FileModel& model, const ServiceSelector& selector,
    const std::string& runtime_import_path);

// The generator protoc talks to.
//
// protoc calls `Generate` for each file to generate, one after another. Each
// call is independent from others. If any of them fails, protoc fails the
// whole run.
class CacheManagerGenerator : public google::protobuf::compiler::CodeGenerator {
 public:
  bool Generate(const google::protobuf::FileDescriptor* file,
                const std::string& parameter,
                google::protobuf::compiler::GeneratorContext* generator_context,
                std::string* error) const override;

  std::uint64_t GetSupportedFeatures() const override {
    return FEATURE_PROTO3_OPTIONAL;
  }

 private:
  Status GenerateFile(const google::protobuf::FileDescriptor* file,
                      const std::string& parameter, CodeWriter* writer) const;
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_CACHE_MANAGER_GENERATOR_H_
