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

#include "cachegen/plugin/options.h"

#include <string>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "google/protobuf/compiler/code_generator.h"

#include "cachegen/base/logging.h"
#include "cachegen/base/string.h"
#include "cachegen/plugin/errors.h"

DEFINE_string(cachegen_marker_suffix, "Cache",
              "Services whose (Go) name ends with this suffix get a cache "
              "manager generated. Can be overridden by generator parameter "
              "`marker_suffix`.");
DEFINE_string(cachegen_runtime_import_path,
              "github.com/NSXBet/go-cache-manager/pkg/gocachemanager",
              "Go import path of the cache manager runtime used by generated "
              "code. Can be overridden by generator parameter "
              "`runtime_import_path`.");

namespace cachegen::plugin {

GeneratorOptions GetDefaultGeneratorOptions() {
  GeneratorOptions options;
  options.marker_suffix = FLAGS_cachegen_marker_suffix;
  options.runtime_import_path = FLAGS_cachegen_runtime_import_path;
  return options;
}

Status ParseGeneratorOptions(const std::string& parameter,
                             GeneratorOptions* options) {
  std::vector<std::pair<std::string, std::string>> params;
  google::protobuf::compiler::ParseGeneratorParameter(parameter, &params);

  for (auto&& [key, value] : params) {
    CACHEGEN_VLOG(1, "Generator parameter [{}] = [{}].", key, value);
    if (key == "marker_suffix") {
      if (value.empty()) {
        return Status(GeneratorError::InvalidParameter,
                      "`marker_suffix` may not be empty.");
      }
      options->marker_suffix = value;
    } else if (key == "runtime_import_path") {
      if (value.empty()) {
        return Status(GeneratorError::InvalidParameter,
                      "`runtime_import_path` may not be empty.");
      }
      options->runtime_import_path = value;
    } else if (key == "paths") {
      if (value == "import") {
        options->paths = PathMode::Import;
      } else if (value == "source_relative") {
        options->paths = PathMode::SourceRelative;
      } else {
        return Status(
            GeneratorError::InvalidParameter,
            Format("Unknown value [{}] for `paths`. Expecting `import` or "
                   "`source_relative`.",
                   value));
      }
    } else if (key == "module") {
      options->module = value;
    } else if (key.size() > 1 && key[0] == 'M') {
      if (value.empty()) {
        return Status(GeneratorError::InvalidParameter,
                      Format("No import path given for [{}].", key.substr(1)));
      }
      options->import_paths[key.substr(1)] = value;
    } else {
      return Status(GeneratorError::InvalidParameter,
                    Format("Unknown generator parameter [{}].", key));
    }
  }
  return {};
}

}  // namespace cachegen::plugin
