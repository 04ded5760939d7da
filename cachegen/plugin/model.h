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

#ifndef CACHEGEN_PLUGIN_MODEL_H_
#define CACHEGEN_PLUGIN_MODEL_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "google/protobuf/descriptor.h"

#include "cachegen/base/status.h"
#include "cachegen/plugin/go_names.h"
#include "cachegen/plugin/options.h"

// Read-only view of what we generate code from.
//
// Objects here are built once per `.proto` file from its descriptors and are
// never mutated afterwards. Emitting code from them (instead of descriptors
// directly) keeps the emitter testable with synthetic names.

namespace cachegen::plugin {

// A Go identifier along with the import path of the package declaring it.
struct GoIdent {
  std::string import_path;
  std::string name;

  // Name the package at `import_path` declares itself as. If empty, it's
  // derived from the last element of `import_path`.
  std::string package_name;
};

class ServiceModel;

struct MethodModel {
  std::string name;  // Go name, e.g. `GetOrder`.
  GoIdent input;
  GoIdent output;

  // Leading comment as recorded by protoc (comment markers removed, one line
  // per `\n`). Empty if there's none.
  std::string leading_comments;

  const ServiceModel* parent = nullptr;
};

class ServiceModel {
 public:
  ServiceModel(std::string name, std::string leading_comments)
      : name_(std::move(name)),
        leading_comments_(std::move(leading_comments)) {}

  // `MethodModel::parent` points back to us.
  ServiceModel(const ServiceModel&) = delete;
  ServiceModel& operator=(const ServiceModel&) = delete;

  // Go name, e.g. `OrderCache`.
  const std::string& name() const noexcept { return name_; }
  const std::string& leading_comments() const noexcept {
    return leading_comments_;
  }

  // In declaration order.
  const std::vector<std::unique_ptr<MethodModel>>& methods() const noexcept {
    return methods_;
  }

  const MethodModel* AddMethod(std::string name, GoIdent input, GoIdent output,
                               std::string leading_comments = "");

 private:
  std::string name_;
  std::string leading_comments_;
  std::vector<std::unique_ptr<MethodModel>> methods_;
};

class FileModel {
 public:
  FileModel() = default;
  FileModel(const FileModel&) = delete;
  FileModel& operator=(const FileModel&) = delete;

  // Path of the `.proto` file, e.g. `order/order.proto`.
  const std::string& proto_path() const noexcept { return proto_path_; }
  const GoPackage& go_package() const noexcept { return go_package_; }

  // Generated files are named `<prefix>_xxx.pb.go`.
  const std::string& generated_filename_prefix() const noexcept {
    return generated_filename_prefix_;
  }

  // In declaration order.
  const std::vector<std::unique_ptr<ServiceModel>>& services() const noexcept {
    return services_;
  }

  void Initialize(std::string proto_path, GoPackage go_package,
                  std::string generated_filename_prefix);
  ServiceModel* AddService(std::string name, std::string leading_comments = "");

 private:
  std::string proto_path_;
  GoPackage go_package_;
  std::string generated_filename_prefix_;
  std::vector<std::unique_ptr<ServiceModel>> services_;
};

// Build model of `file`. Go packages of message types referenced by methods
// are resolved as well, so this fails if any of them is unknown.
Status BuildFileModel(const google::protobuf::FileDescriptor* file,
                      const GeneratorOptions& options, FileModel* model);

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_MODEL_H_
