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

#ifndef CACHEGEN_BASE_LOGGING_H_
#define CACHEGEN_BASE_LOGGING_H_

#include <atomic>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "fmt/format.h"
#include "glog/logging.h"

#include "cachegen/base/likely.h"

// Logging macros backed by glog. Messages are formatted with fmt, e.g.:
//
// CACHEGEN_VLOG(1, "Generating [{}] for [{}].", filename, service);
//
// Keep in mind that stdout of a protoc plugin is reserved for the serialized
// `CodeGeneratorResponse`. Never write logs there.

#define CACHEGEN_CHECK(expr, ...) \
  CACHEGEN_INTERNAL_DETAIL_LOGGING_CHECK(expr, ##__VA_ARGS__)

#ifndef NDEBUG
#define CACHEGEN_DCHECK(expr, ...) CACHEGEN_CHECK(expr, ##__VA_ARGS__)
#else
#define CACHEGEN_DCHECK(expr, ...) \
  while (0) CACHEGEN_CHECK(expr, ##__VA_ARGS__)
#endif

#define CACHEGEN_VLOG(n, ...)                                         \
  LOG_IF(INFO, CACHEGEN_UNLIKELY(VLOG_IS_ON(n)))                      \
      << ::cachegen::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                  __VA_ARGS__)

#define CACHEGEN_LOG_ERROR(...)                                              \
  LOG(ERROR) << ::cachegen::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                         __VA_ARGS__)

#define CACHEGEN_LOG_WARNING_IF(expr, ...)                            \
  LOG_IF(WARNING, CACHEGEN_UNLIKELY(expr))                            \
      << ::cachegen::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                  __VA_ARGS__)

#define CACHEGEN_LOG_ERROR_IF_ONCE(expr, ...)                   \
  do {                                                          \
    if (CACHEGEN_UNLIKELY(expr)) {                              \
      CACHEGEN_INTERNAL_DETAIL_LOG_ONCE(ERROR, __VA_ARGS__);    \
    }                                                           \
  } while (0)

#define CACHEGEN_UNREACHABLE(...)                                          \
  do {                                                                     \
    [&]() __attribute__((noreturn, noinline, cold)) {                      \
      LOG(FATAL) << "UNREACHABLE. "                                        \
                 << ::cachegen::internal::logging::FormatLog(              \
                        __FILE__, __LINE__, ##__VA_ARGS__);                \
      __builtin_unreachable();                                             \
    }                                                                      \
    ();                                                                    \
  } while (0)

///////////////////////////////////////
// Implementation goes below.        //
///////////////////////////////////////

namespace cachegen::internal::logging {

namespace details {

// Only used when `FormatLog` fails, to dump what we've been given.
template <class T>
std::string ToString(const T& value) {
  return fmt::format("{}", value);
}

std::string DescribeFormatArguments(const std::vector<std::string>& args);

}  // namespace details

inline std::string FormatLog([[maybe_unused]] const char* file,
                             [[maybe_unused]] int line) noexcept {
  return {};
}

// Throwing in formatting log is likely a programming error. We don't abort the
// whole program merely because of a mal-formatted log message though.
template <class... Ts>
std::string FormatLog(const char* file, int line, std::string_view format,
                      const Ts&... args) noexcept {
  try {
    return fmt::format(fmt::runtime(format), args...);
  } catch (const std::exception& xcpt) {
    return fmt::format(
        "Failed to format log at [{}:{}] with format [{}] and arguments ({}): "
        "{}",
        file, line, format,
        details::DescribeFormatArguments({details::ToString(args)...}),
        xcpt.what());
  }
}

}  // namespace cachegen::internal::logging

#define CACHEGEN_INTERNAL_DETAIL_LOGGING_CHECK(expr, ...)                    \
  do {                                                                       \
    if (CACHEGEN_UNLIKELY(!(expr))) {                                        \
      [&]() __attribute__((noreturn, noinline, cold)) {                      \
        ::google::LogMessage(__FILE__, __LINE__, ::google::GLOG_FATAL)       \
                .stream()                                                    \
            << "Check failed: " #expr " "                                    \
            << ::cachegen::internal::logging::FormatLog(__FILE__, __LINE__,  \
                                                        ##__VA_ARGS__);      \
        CACHEGEN_UNREACHABLE();                                              \
      }();                                                                   \
    }                                                                        \
  } while (0)

#define CACHEGEN_INTERNAL_DETAIL_LOG_ONCE(Level, ...)                      \
  do {                                                                     \
    static ::std::atomic<bool> cachegen_anonymous_logged{false};           \
    if (!cachegen_anonymous_logged.exchange(true)) {                       \
      LOG(Level) << ::cachegen::internal::logging::FormatLog(              \
          __FILE__, __LINE__, __VA_ARGS__);                                \
    }                                                                      \
  } while (0)

#endif  // CACHEGEN_BASE_LOGGING_H_
