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

#ifndef CACHEGEN_PLUGIN_GO_NAMES_H_
#define CACHEGEN_PLUGIN_GO_NAMES_H_

#include <string>
#include <string_view>

#include "google/protobuf/descriptor.h"

#include "cachegen/base/status.h"
#include "cachegen/plugin/options.h"

// Derivation of Go-side names from protobuf descriptors. These follow what
// protoc-gen-go does, so that identifiers we reference match those it
// generates for the messages.

namespace cachegen::plugin {

// A Go package, identified by its import path, and the name it's referred to.
struct GoPackage {
  std::string import_path;
  std::string name;
};

// Convert a protobuf name to a Go exported identifier, e.g. `get_order` to
// `GetOrder`, `Outer.Inner` to `Outer_Inner`.
std::string GoCamelCase(std::string_view s);

// Make `s` a valid Go identifier. Invalid characters are replaced by `_`, a
// `_` is prepended if it clashes with a keyword or does not start with a
// letter.
std::string GoSanitized(std::string_view s);

// Last element of a slash-separated path.
std::string_view PathBaseName(std::string_view path);

// Go identifier of a message, relative to its package, e.g. `OrderResp` or
// `Order_Item` for nested messages.
std::string GetGoMessageName(const google::protobuf::Descriptor* message);

// Determine import path and package name of `file`, using `M` mappings in
// `options` first and `go_package` option otherwise.
Status ResolveGoPackage(const google::protobuf::FileDescriptor* file,
                        const GeneratorOptions& options, GoPackage* package);

// Determine prefix of files generated for `file`, honoring `paths=` and
// `module=`.
Status GetGeneratedFilenamePrefix(const google::protobuf::FileDescriptor* file,
                                  const GoPackage& package,
                                  const GeneratorOptions& options,
                                  std::string* prefix);

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_GO_NAMES_H_
