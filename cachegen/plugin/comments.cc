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

#include "cachegen/plugin/comments.h"

#include <string>

#include "cachegen/base/string.h"

namespace cachegen::plugin {

namespace {

std::string_view TrimTrailingNewline(std::string_view s) {
  if (!s.empty() && s.back() == '\n') {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

std::string FormatLeadingComments(std::string_view leading) {
  if (leading.empty()) {
    return {};
  }
  std::string result;
  for (auto&& line : Split(TrimTrailingNewline(leading), '\n', true)) {
    result += Format("//{}\n", line);
  }
  return result;
}

std::string GetManagerTypeComment(std::string_view manager,
                                  std::string_view leading) {
  if (leading.empty()) {
    return {};
  }
  return Format("// {} for every operation related to this service:\n{}",
                manager, FormatLeadingComments(leading));
}

std::string GetConstructorComment(std::string_view constructor,
                                  std::string_view leading) {
  if (leading.empty()) {
    return {};
  }
  return Format("// {} is the constructor method for this service:\n{}",
                constructor, FormatLeadingComments(leading));
}

std::string GetFetchMethodComment(std::string_view leading) {
  if (leading.empty()) {
    return {};
  }
  auto stripped =
      Replace(Replace(FormatLeadingComments(leading), "// ", ""), "//", "");

  // The first line is glued to `Get`. If the comment spans several lines,
  // the rest of them are commented out again, otherwise they'd end up as code.
  std::string result;
  auto lines = Split(TrimTrailingNewline(stripped), '\n', true);
  for (std::size_t i = 0; i != lines.size(); ++i) {
    auto line = TrimRight(lines[i]);
    if (i == 0) {
      result += Format("// Get{}\n", line);
    } else if (line.empty()) {
      result += "//\n";
    } else {
      result += Format("// {}\n", line);
    }
  }
  return result;
}

std::string GetRefreshMethodComment(std::string_view leading) {
  if (leading.empty()) {
    return {};
  }
  return "// Eagerly refresh the cache for the method that:\n" +
         FormatLeadingComments(leading);
}

}  // namespace cachegen::plugin
