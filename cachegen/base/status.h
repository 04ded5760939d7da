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

#ifndef CACHEGEN_BASE_STATUS_H_
#define CACHEGEN_BASE_STATUS_H_

#include <memory>
#include <string>
#include <type_traits>

namespace cachegen {

// This class describes status code, as its name implies.
//
// `0` is treated as success, other values are failures.
class Status {
 public:
  Status() noexcept = default;
  explicit Status(int status, const std::string& desc = "");

  // Enumerations whose underlying type is `int` (the default) can be used
  // directly, value 0 still means success.
  template <class T, class = std::enable_if_t<std::is_enum_v<T>>>
  explicit Status(T status, const std::string& desc = "")
      : Status(static_cast<int>(status), desc) {
    static_assert(std::is_same_v<std::underlying_type_t<T>, int>);
  }

  // Test if this object represents a successful status.
  bool ok() const noexcept { return !state_; }

  // Get status value.
  int code() const noexcept { return !state_ ? 0 : state_->status; }

  // Get description of the status.
  const std::string& message() const noexcept;

  // Returns a human readable string describing the status.
  std::string ToString() const;

 private:
  struct State {
    int status;
    std::string desc;
  };
  // `nullptr` for success. Failures share their (immutable) state on copy.
  std::shared_ptr<const State> state_;
};

}  // namespace cachegen

#endif  // CACHEGEN_BASE_STATUS_H_
