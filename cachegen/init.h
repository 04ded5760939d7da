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

#ifndef CACHEGEN_INIT_H_
#define CACHEGEN_INIT_H_

#include <functional>

namespace cachegen {

// Parse command line flags, initialize logging, call user's callback and
// return whatever it returns.
//
// `argc` / `argv` passed to `cb` have flags recognized by gflags removed. This
// matters for protoc plugins, as `PluginMain` refuses any extra argument.
//
// Logs are written to stderr unless `--logtostderr` is explicitly given. The
// plugin's stdout is used for talking to protoc.
int Start(int argc, char** argv, std::function<int(int, char**)> cb);

}  // namespace cachegen

#endif  // CACHEGEN_INIT_H_
