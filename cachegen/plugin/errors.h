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

#ifndef CACHEGEN_PLUGIN_ERRORS_H_
#define CACHEGEN_PLUGIN_ERRORS_H_

namespace cachegen::plugin {

// Status codes used by the generator. All of them abort the protoc run.
enum class GeneratorError {
  // Unrecognized or malformed `--go-cache-manager_opt`.
  InvalidParameter = 1,

  // Neither `go_package` nor an `M` mapping tells us the Go import path.
  MissingGoImportPath = 2,

  // Output path does not start with `module=` prefix.
  PathMismatch = 3,

  // `GeneratorContext` refused our output.
  WriteFailure = 4
};

}  // namespace cachegen::plugin

#endif  // CACHEGEN_PLUGIN_ERRORS_H_
