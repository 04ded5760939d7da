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

#ifndef CACHEGEN_PLUGIN_COMMENTS_H_
#define CACHEGEN_PLUGIN_COMMENTS_H_

#include <string>
#include <string_view>

// Doc comments of generated declarations, derived from leading comments in
// `.proto` files.
//
// `leading` below is always the raw leading comment recorded by protoc. All
// functions return an empty string if `leading` is empty, otherwise the result
// consists of full `//` lines, each terminated by `\n`.

namespace cachegen::plugin {

// Renders `leading` as Go line comments, one `//` per line. Text is kept
// verbatim (including the space protoc leaves after `//` in the source).
std::string FormatLeadingComments(std::string_view leading);

// Comment of the aggregate manager type.
std::string GetManagerTypeComment(std::string_view manager,
                                  std::string_view leading);

// Comment of the constructor.
std::string GetConstructorComment(std::string_view constructor,
                                  std::string_view leading);

// Comment of the fetch-through-cache method: `Get` immediately followed by the
// comment text with comment markers stripped, e.g. ` Fetches an order.`
// becomes `// GetFetches an order.`.
std::string GetFetchMethodComment(std::string_view leading);

// Comment of the force-refresh method.
std::string GetRefreshMethodComment(std::string_view leading);

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_COMMENTS_H_
