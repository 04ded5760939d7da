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

#include "cachegen/init.h"

#include <utility>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "cachegen/base/logging.h"

namespace cachegen {

int Start(int argc, char** argv, std::function<int(int, char**)> cb) {
  google::InstallFailureSignalHandler();

  google::SetUsageMessage(
      "protoc plugin generating Go cache managers for services.\n"
      "Usage: protoc --plugin=protoc-gen-go-cache-manager=<path> "
      "--go-cache-manager_out=<dir> [--go-cache-manager_opt=<k=v,...>] "
      "<proto files>");
  google::ParseCommandLineFlags(&argc, &argv, true);

  if (google::GetCommandLineFlagInfoOrDie("logtostderr").is_default) {
    FLAGS_logtostderr = true;
  }
  google::InitGoogleLogging(argv[0]);

  CACHEGEN_VLOG(1, "Started with [{}] positional argument(s).", argc - 1);
  auto rc = cb(argc, argv);
  CACHEGEN_VLOG(1, "Exiting with [{}].", rc);

  google::ShutdownGoogleLogging();
  return rc;
}

}  // namespace cachegen
