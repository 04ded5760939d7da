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

#ifndef CACHEGEN_PLUGIN_GENERATED_FILE_H_
#define CACHEGEN_PLUGIN_GENERATED_FILE_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "cachegen/plugin/go_names.h"
#include "cachegen/plugin/model.h"

namespace cachegen::plugin {

// A Go source file being generated.
//
// Declarations are appended in emission order. Imports are not written by
// hand: they're collected as identifiers from other packages are referenced
// via `QualifiedGoIdent`, and rendered in `Render()`.
class GeneratedFile {
 public:
  GeneratedFile(std::string filename, std::string proto_path,
                GoPackage package);

  const std::string& filename() const noexcept { return filename_; }
  const GoPackage& package() const noexcept { return package_; }

  // Returns how `ident` should be spelled in this file (`pkg.Name`, or simply
  // `Name` if it's declared in our own package), and imports its package if
  // necessary.
  std::string QualifiedGoIdent(const GoIdent& ident);

  // Append a top-level declaration (or several of them).
  void Append(std::string fragment);

  const std::vector<std::string>& fragments() const noexcept {
    return fragments_;
  }

  // Header, package clause, imports and all fragments.
  std::string Render() const;

 private:
  // Name we refer to package at `import_path` with. `package_name` is preferred
  // unless it's already taken.
  const std::string& ImportPackage(const std::string& import_path,
                                   const std::string& package_name);

 private:
  std::string filename_;
  std::string proto_path_;
  GoPackage package_;

  std::map<std::string, std::string> imports_;  // Import path -> name.
  // Includes identifiers declared locally by generated code.
  std::set<std::string> used_package_names_;
  std::vector<std::string> fragments_;
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_GENERATED_FILE_H_
