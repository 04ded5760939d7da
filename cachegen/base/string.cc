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

#include "cachegen/base/string.h"

#include <string>
#include <vector>

#include "cachegen/base/logging.h"

namespace cachegen {

namespace {

template <class T>
std::string JoinImpl(const T& parts, std::string_view delim) {
  std::string result;
  for (auto iter = parts.begin(); iter != parts.end(); ++iter) {
    if (iter != parts.begin()) {
      result.append(delim.begin(), delim.end());
    }
    result.append(iter->begin(), iter->end());
  }
  return result;
}

}  // namespace

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

void Replace(std::string_view from, std::string_view to, std::string* str,
             std::size_t count) {
  CACHEGEN_CHECK(!from.empty(), "`from` may not be empty.");
  auto p = str->find(from);
  while (p != std::string::npos && count--) {
    str->replace(p, from.size(), to);
    p = str->find(from, p + to.size());
  }
}

std::string Replace(std::string_view str, std::string_view from,
                    std::string_view to, std::size_t count) {
  std::string cp(str);
  Replace(from, to, &cp, count);
  return cp;
}

std::string_view TrimRight(std::string_view str) {
  auto e = str.find_last_not_of(" \t\r");
  if (e == std::string_view::npos) {
    return {};
  }
  return str.substr(0, e + 1);
}

std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty) {
  std::vector<std::string_view> splited;
  if (s.empty()) {
    return splited;
  }
  std::size_t start = 0;
  while (true) {
    auto pos = s.find(delim, start);
    auto part = s.substr(start, pos == std::string_view::npos
                                    ? std::string_view::npos
                                    : pos - start);
    if (!part.empty() || keep_empty) {
      splited.push_back(part);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return splited;
}

std::string Join(const std::vector<std::string_view>& parts,
                 std::string_view delim) {
  return JoinImpl(parts, delim);
}

std::string Join(const std::vector<std::string>& parts,
                 std::string_view delim) {
  return JoinImpl(parts, delim);
}

char ToUpper(char c) {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c ^ 32) : c;
}

char ToLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c ^ 32) : c;
}

std::string ToLower(std::string_view s) {
  std::string result;
  result.reserve(s.size());
  for (auto&& e : s) {
    result.push_back(ToLower(e));
  }
  return result;
}

}  // namespace cachegen
