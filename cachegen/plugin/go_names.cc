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

#include "cachegen/plugin/go_names.h"

#include <string>
#include <unordered_set>

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"
#include "cachegen/plugin/errors.h"

using namespace std::literals;

namespace cachegen::plugin {

namespace {

bool IsAsciiLower(char c) { return c >= 'a' && c <= 'z'; }
bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

// Bytes of multi-byte UTF-8 sequences are treated as letters, Go accepts
// Unicode letters in identifiers.
bool IsLetter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsGoKeyword(std::string_view s) {
  static const std::unordered_set<std::string_view> kKeywords = {
      "break",  "case",    "chan",   "const",       "continue",
      "default", "defer",  "else",   "fallthrough", "for",
      "func",   "go",      "goto",   "if",          "import",
      "interface", "map",  "package", "range",      "return",
      "select", "struct",  "switch", "type",        "var"};
  return kKeywords.count(s) != 0;
}

// Splits `go_package` (or an `M` mapping) in the form of `path[;name]`.
GoPackage ParseGoPackageOption(std::string_view option) {
  GoPackage result;
  if (auto pos = option.find(';'); pos != std::string_view::npos) {
    result.import_path = std::string(option.substr(0, pos));
    result.name = std::string(option.substr(pos + 1));
  } else {
    result.import_path = std::string(option);
  }
  if (result.name.empty()) {
    result.name = std::string(PathBaseName(result.import_path));
  }
  result.name = GoSanitized(result.name);
  return result;
}

}  // namespace

std::string GoCamelCase(std::string_view s) {
  // A word at a time. Words are delimited by `_`, `.`, upper case letters or
  // digits. The first letter of each word is capitalized.
  std::string result;
  result.reserve(s.size());
  for (std::size_t i = 0; i != s.size(); ++i) {
    auto c = s[i];
    if (c == '.' && i + 1 < s.size() && IsAsciiLower(s[i + 1])) {
      // Skip over `.` in `.{lowercase}`.
    } else if (c == '.') {
      result.push_back('_');
    } else if (c == '_' && (i == 0 || s[i - 1] == '.')) {
      // Make sure the result starts with a capital letter.
      result.push_back('X');
    } else if (c == '_' && i + 1 < s.size() && IsAsciiLower(s[i + 1])) {
      // Skip over `_` in `_{lowercase}`.
    } else if (IsAsciiDigit(c)) {
      result.push_back(c);
    } else {
      result.push_back(ToUpper(c));
      while (i + 1 < s.size() && IsAsciiLower(s[i + 1])) {
        result.push_back(s[++i]);
      }
    }
  }
  return result;
}

std::string GoSanitized(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 1);
  for (auto&& c : s) {
    result.push_back(IsLetter(c) || IsAsciiDigit(c) ? c : '_');
  }
  if (result.empty() || !IsLetter(result.front()) || IsGoKeyword(result)) {
    result.insert(result.begin(), '_');
  }
  return result;
}

std::string_view PathBaseName(std::string_view path) {
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  if (auto pos = path.rfind('/'); pos != std::string_view::npos) {
    return path.substr(pos + 1);
  }
  return path;
}

std::string GetGoMessageName(const google::protobuf::Descriptor* message) {
  std::string_view name = message->full_name();
  auto&& package = message->file()->package();
  if (!package.empty() && StartsWith(name, package + ".")) {
    name.remove_prefix(package.size() + 1);
  }
  return GoCamelCase(name);
}

Status ResolveGoPackage(const google::protobuf::FileDescriptor* file,
                        const GeneratorOptions& options, GoPackage* package) {
  std::string option;
  if (auto iter = options.import_paths.find(file->name());
      iter != options.import_paths.end()) {
    option = iter->second;
  } else if (file->options().has_go_package()) {
    option = file->options().go_package();
  }

  *package = ParseGoPackageOption(option);
  if (package->import_path.empty()) {
    return Status(
        GeneratorError::MissingGoImportPath,
        Format("Unable to determine Go import path for [{}]. Specify "
               "`option go_package` in it, or pass `M{}=<import path>` to the "
               "generator.",
               file->name(), file->name()));
  }
  return {};
}

Status GetGeneratedFilenamePrefix(const google::protobuf::FileDescriptor* file,
                                  const GoPackage& package,
                                  const GeneratorOptions& options,
                                  std::string* prefix) {
  std::string_view name = file->name();
  for (auto&& ext : {".proto"sv, ".protodevel"sv}) {
    if (EndsWith(name, ext)) {
      name.remove_suffix(ext.size());
      break;
    }
  }

  if (options.paths == PathMode::Import) {
    CACHEGEN_CHECK(!package.import_path.empty());
    *prefix = Format("{}/{}", package.import_path, PathBaseName(name));
  } else {
    *prefix = std::string(name);
  }

  if (!options.module.empty()) {
    auto module_prefix = options.module + "/";
    if (!StartsWith(*prefix, module_prefix)) {
      return Status(GeneratorError::PathMismatch,
                    Format("Generated file [{}] for [{}] does not match "
                           "prefix [{}] given by `module=`.",
                           *prefix, file->name(), options.module));
    }
    prefix->erase(0, module_prefix.size());
  }
  return {};
}

}  // namespace cachegen::plugin
