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

#ifndef CACHEGEN_PLUGIN_OPTIONS_H_
#define CACHEGEN_PLUGIN_OPTIONS_H_

#include <map>
#include <string>

#include "cachegen/base/status.h"

namespace cachegen::plugin {

// Same meaning as protoc-gen-go's `paths=`.
enum class PathMode {
  // Output is placed in a directory named after the Go import path.
  Import,

  // Output is placed next to the `.proto` file, relative to the output dir.
  SourceRelative
};

struct GeneratorOptions {
  // Services whose Go name ends with this are generated.
  std::string marker_suffix;

  // Go import path of the cache manager runtime library.
  std::string runtime_import_path;

  PathMode paths = PathMode::Import;

  // If non-empty, stripped from the output filename (`module=`).
  std::string module;

  // `M<proto path>=<go import path>`, overrides `go_package`.
  std::map<std::string, std::string> import_paths;
};

// Options with defaults taken from command line flags.
GeneratorOptions GetDefaultGeneratorOptions();

// Parse the parameter passed by protoc (`--go-cache-manager_opt=...`) on top of
// whatever is already in `options`.
//
// Recognized keys are `marker_suffix`, `runtime_import_path`, `paths`,
// `module` and `M<proto path>`. Anything else is an error.
Status ParseGeneratorOptions(const std::string& parameter,
                             GeneratorOptions* options);

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_OPTIONS_H_
