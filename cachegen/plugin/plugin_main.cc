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

// Usage:
//
// protoc --plugin=protoc-gen-go-cache-manager=path/to/plugin
//   --go_out=./ --go-cache-manager_out=./ proto_file
//
// Generator parameters (`--go-cache-manager_opt=...`) are described in
// `cachegen/plugin/options.h`.

#include "google/protobuf/compiler/plugin.h"

#include "cachegen/init.h"
#include "cachegen/plugin/cache_manager_generator.h"

int main(int argc, char* argv[]) {
  return cachegen::Start(argc, argv, [](int argc, char** argv) {
    cachegen::plugin::CacheManagerGenerator gen;
    return google::protobuf::compiler::PluginMain(argc, argv, &gen);
  });
}
