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

#ifndef CACHEGEN_TESTING_PROTO_FILE_H_
#define CACHEGEN_TESTING_PROTO_FILE_H_

#include <map>
#include <string>

#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/io/zero_copy_stream.h"

namespace cachegen::testing {

// Parses `source` (content of a `.proto` file) and builds it into `pool` as
// `filename`, with source locations (hence comments) kept. Files it imports
// must have been built into `pool` beforehand.
//
// Returns `nullptr` on error, errors are logged.
const google::protobuf::FileDescriptor* BuildProtoFile(
    const std::string& filename, const std::string& source,
    google::protobuf::DescriptorPool* pool);

// `GeneratorContext` that keeps everything written to it in memory.
class TestGeneratorContext
    : public google::protobuf::compiler::GeneratorContext {
 public:
  google::protobuf::io::ZeroCopyOutputStream* Open(
      const std::string& filename) override;

  // Filename -> content.
  const std::map<std::string, std::string>& files() const noexcept {
    return files_;
  }

 private:
  std::map<std::string, std::string> files_;
};

}  // namespace cachegen::testing

#endif  // CACHEGEN_TESTING_PROTO_FILE_H_
