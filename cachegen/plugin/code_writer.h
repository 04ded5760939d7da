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

#ifndef CACHEGEN_PLUGIN_CODE_WRITER_H_
#define CACHEGEN_PLUGIN_CODE_WRITER_H_

#include <string>

#include "cachegen/base/status.h"

namespace cachegen::plugin {

// This interface accepts generated code and writes it to its destination.
class CodeWriter {
 public:
  virtual ~CodeWriter() = default;

  // Writes a whole file at once. Each file is written at most once.
  virtual Status WriteFile(const std::string& filename,
                           const std::string& content) = 0;
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_CODE_WRITER_H_
