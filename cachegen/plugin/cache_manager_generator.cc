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

#include "cachegen/plugin/cache_manager_generator.h"

#include <memory>
#include <string>

#include "google/protobuf/io/coded_stream.h"
#include "google/protobuf/io/zero_copy_stream.h"

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"
#include "cachegen/plugin/errors.h"
#include "cachegen/plugin/manager_decl_generator.h"
#include "cachegen/plugin/options.h"

namespace cachegen::plugin {

namespace {

// Writes files via `GeneratorContext`. protoc only commits them once the whole
// run succeeded.
class ContextCodeWriter : public CodeWriter {
 public:
  explicit ContextCodeWriter(
      google::protobuf::compiler::GeneratorContext* context)
      : context_(context) {}

  Status WriteFile(const std::string& filename,
                   const std::string& content) override {
    std::unique_ptr<google::protobuf::io::ZeroCopyOutputStream> output(
        context_->Open(filename));
    if (!output) {
      return Status(GeneratorError::WriteFailure,
                    Format("Failed to open [{}] for writing.", filename));
    }
    google::protobuf::io::CodedOutputStream coded(output.get());
    coded.WriteString(content);
    coded.Trim();  // Flushes buffered bytes, which may fail as well.
    if (coded.HadError()) {
      return Status(GeneratorError::WriteFailure,
                    Format("Failed to write [{}].", filename));
    }
    return {};
  }

 private:
  google::protobuf::compiler::GeneratorContext* context_;
};

}  // namespace

std::string GetCacheManagerFilename(const FileModel& model) {
  return model.generated_filename_prefix() + "_cache_manager.pb.go";
}

std::unique_ptr<GeneratedFile> GenerateCacheManagerFile(
    const FileModel& model, const ServiceSelector& selector,
    const std::string& runtime_import_path) {
  ManagerDeclGenerator generator(runtime_import_path);
  std::unique_ptr<GeneratedFile> file;

  for (auto&& service : selector.SelectFrom(model)) {
    if (!file) {
      file = std::make_unique<GeneratedFile>(GetCacheManagerFilename(model),
                                             model.proto_path(),
                                             model.go_package());
    }
    generator.GenerateService(*service, file.get());
  }
  return file;
}

bool CacheManagerGenerator::Generate(
    const google::protobuf::FileDescriptor* file, const std::string& parameter,
    google::protobuf::compiler::GeneratorContext* generator_context,
    std::string* error) const {
  ContextCodeWriter writer(generator_context);
  if (auto st = GenerateFile(file, parameter, &writer); !st.ok()) {
    CACHEGEN_LOG_ERROR("Failed to generate cache manager for [{}]: {}",
                       file->name(), st.ToString());
    *error = Format("{}: {}", file->name(), st.message());
    return false;
  }
  return true;
}

Status CacheManagerGenerator::GenerateFile(
    const google::protobuf::FileDescriptor* file, const std::string& parameter,
    CodeWriter* writer) const {
  auto options = GetDefaultGeneratorOptions();
  if (auto st = ParseGeneratorOptions(parameter, &options); !st.ok()) {
    return st;
  }
  // Still possible via `--cachegen_marker_suffix`.
  if (options.marker_suffix.empty()) {
    return Status(GeneratorError::InvalidParameter,
                  "Marker suffix may not be empty.");
  }

  // Files without anything to generate are left alone, even if we can't tell
  // their Go package.
  ServiceSelector selector(options.marker_suffix);
  if (!selector.HasCandidate(file)) {
    CACHEGEN_VLOG(1, "No service suffixed by [{}] in [{}], skipped.",
                  options.marker_suffix, file->name());
    return {};
  }

  FileModel model;
  if (auto st = BuildFileModel(file, options, &model); !st.ok()) {
    return st;
  }
  auto generated =
      GenerateCacheManagerFile(model, selector, options.runtime_import_path);
  CACHEGEN_CHECK(generated, "No service is selected from [{}].", file->name());
  return writer->WriteFile(generated->filename(), generated->Render());
}

}  // namespace cachegen::plugin
