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

#include "cachegen/plugin/generated_file.h"

#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"

namespace cachegen::plugin {

namespace {

// Standard library packages do not have a domain name in their first path
// element.
bool IsStandardLibrary(std::string_view import_path) {
  auto first = import_path.substr(0, import_path.find('/'));
  return first.find('.') == std::string_view::npos;
}

// Parameters and locals of generated functions. Packages must not be imported
// as any of them, otherwise they'd be shadowed.
const char* const kLocalIdentifiers[] = {"cm", "ctx", "err", "input",
                                         "options"};

// Packages outside the standard library may declare a name other than the
// last element of their import path, so they're always imported with an
// explicit name.
std::string RenderImportSpec(const std::string& import_path,
                             const std::string& name) {
  if (IsStandardLibrary(import_path) &&
      name == GoSanitized(PathBaseName(import_path))) {
    return Format("\t\"{}\"\n", import_path);
  }
  return Format("\t{} \"{}\"\n", name, import_path);
}

}  // namespace

GeneratedFile::GeneratedFile(std::string filename, std::string proto_path,
                             GoPackage package)
    : filename_(std::move(filename)),
      proto_path_(std::move(proto_path)),
      package_(std::move(package)),
      used_package_names_(std::begin(kLocalIdentifiers),
                          std::end(kLocalIdentifiers)) {}

std::string GeneratedFile::QualifiedGoIdent(const GoIdent& ident) {
  if (ident.import_path == package_.import_path) {
    return ident.name;
  }
  return Format("{}.{}", ImportPackage(ident.import_path, ident.package_name),
                ident.name);
}

void GeneratedFile::Append(std::string fragment) {
  CACHEGEN_DCHECK(EndsWith(fragment, "\n"));
  fragments_.push_back(std::move(fragment));
}

std::string GeneratedFile::Render() const {
  std::string result = Format(
      "// Code generated by protoc-gen-go-cache-manager. DO NOT EDIT.\n"
      "// source: {}\n"
      "\n"
      "package {}\n"
      "\n",
      proto_path_, package_.name);

  // `imports_` is ordered by import path, so is the output.
  std::string std_imports, other_imports;
  for (auto&& [path, name] : imports_) {
    (IsStandardLibrary(path) ? std_imports : other_imports) +=
        RenderImportSpec(path, name);
  }
  if (!std_imports.empty() || !other_imports.empty()) {
    result += "import (\n" + std_imports;
    if (!std_imports.empty() && !other_imports.empty()) {
      result += "\n";
    }
    result += other_imports + ")\n\n";
  }

  result += Join(fragments_, "\n");
  return result;
}

const std::string& GeneratedFile::ImportPackage(
    const std::string& import_path, const std::string& package_name) {
  if (auto iter = imports_.find(import_path); iter != imports_.end()) {
    return iter->second;
  }
  auto name = GoSanitized(package_name.empty() ? PathBaseName(import_path)
                                               : package_name);
  auto candidate = name;
  for (int i = 1; used_package_names_.count(candidate); ++i) {
    candidate = Format("{}{}", name, i);
  }
  used_package_names_.insert(candidate);
  return imports_[import_path] = candidate;
}

}  // namespace cachegen::plugin
