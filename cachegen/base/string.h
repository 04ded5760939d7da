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

#ifndef CACHEGEN_BASE_STRING_H_
#define CACHEGEN_BASE_STRING_H_

#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt/format.h"

namespace cachegen {

// @sa: `std::format`
//
// Patterns in the generator are built at runtime (and contain Go's braces
// escaped as `{{` / `}}`), so the format string is not checked at compile time.
template <class... Args>
std::string Format(std::string_view fmt, Args&&... args) {
  return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
}

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

// Replace occurrance of `from` in `str` to `to` for at most `count` times.
void Replace(std::string_view from, std::string_view to, std::string* str,
             std::size_t count = std::numeric_limits<std::size_t>::max());
std::string Replace(
    std::string_view str, std::string_view from, std::string_view to,
    std::size_t count = std::numeric_limits<std::size_t>::max());

// Trim whitespace (space, tab, CR) at the end of the string.
std::string_view TrimRight(std::string_view str);

// Split string by `delim`. Empty parts are dropped unless `keep_empty` is set.
std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty = false);

// Join strings in `parts`, delimited by `delim`.
std::string Join(const std::vector<std::string_view>& parts,
                 std::string_view delim);
std::string Join(const std::vector<std::string>& parts,
                 std::string_view delim);

// ASCII only. Go identifiers we deal with are ASCII anyway.
char ToUpper(char c);
char ToLower(char c);
std::string ToLower(std::string_view s);

}  // namespace cachegen

#endif  // CACHEGEN_BASE_STRING_H_
