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

#include "cachegen/plugin/model.h"

#include <string>
#include <utility>

#include "cachegen/base/logging.h"

namespace cachegen::plugin {

namespace {

template <class T>
std::string GetLeadingComments(const T* descriptor) {
  google::protobuf::SourceLocation location;
  if (!descriptor->GetSourceLocation(&location)) {
    return {};
  }
  return location.leading_comments;
}

Status ResolveMessage(const google::protobuf::Descriptor* message,
                      const GeneratorOptions& options, GoIdent* ident) {
  GoPackage package;
  if (auto st = ResolveGoPackage(message->file(), options, &package);
      !st.ok()) {
    return st;
  }
  ident->import_path = package.import_path;
  ident->name = GetGoMessageName(message);
  ident->package_name = package.name;
  return {};
}

}  // namespace

const MethodModel* ServiceModel::AddMethod(std::string name, GoIdent input,
                                           GoIdent output,
                                           std::string leading_comments) {
  auto&& method = methods_.emplace_back(std::make_unique<MethodModel>());
  method->name = std::move(name);
  method->input = std::move(input);
  method->output = std::move(output);
  method->leading_comments = std::move(leading_comments);
  method->parent = this;
  return method.get();
}

void FileModel::Initialize(std::string proto_path, GoPackage go_package,
                           std::string generated_filename_prefix) {
  CACHEGEN_CHECK(services_.empty(), "Initializing a populated model.");
  proto_path_ = std::move(proto_path);
  go_package_ = std::move(go_package);
  generated_filename_prefix_ = std::move(generated_filename_prefix);
}

ServiceModel* FileModel::AddService(std::string name,
                                    std::string leading_comments) {
  return services_
      .emplace_back(std::make_unique<ServiceModel>(std::move(name),
                                                   std::move(leading_comments)))
      .get();
}

Status BuildFileModel(const google::protobuf::FileDescriptor* file,
                      const GeneratorOptions& options, FileModel* model) {
  GoPackage package;
  if (auto st = ResolveGoPackage(file, options, &package); !st.ok()) {
    return st;
  }
  std::string prefix;
  if (auto st = GetGeneratedFilenamePrefix(file, package, options, &prefix);
      !st.ok()) {
    return st;
  }
  model->Initialize(file->name(), std::move(package), std::move(prefix));

  for (int i = 0; i != file->service_count(); ++i) {
    auto&& service = file->service(i);
    auto service_model = model->AddService(GoCamelCase(service->name()),
                                           GetLeadingComments(service));
    for (int j = 0; j != service->method_count(); ++j) {
      auto&& method = service->method(j);
      CACHEGEN_LOG_WARNING_IF(
          method->client_streaming() || method->server_streaming(),
          "Method [{}] is a streaming one, it's cached as if it's unary.",
          method->full_name());
      GoIdent input, output;
      if (auto st = ResolveMessage(method->input_type(), options, &input);
          !st.ok()) {
        return st;
      }
      if (auto st = ResolveMessage(method->output_type(), options, &output);
          !st.ok()) {
        return st;
      }
      service_model->AddMethod(GoCamelCase(method->name()), std::move(input),
                               std::move(output), GetLeadingComments(method));
    }
  }
  return {};
}

}  // namespace cachegen::plugin
