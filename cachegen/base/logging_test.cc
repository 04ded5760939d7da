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

#include "cachegen/base/logging.h"

#include <string>
#include <vector>

#include "gmock/gmock-matchers.h"
#include "gtest/gtest.h"

namespace foreign_ns {

struct AwesomeLogSink : public google::LogSink {
  void send(google::LogSeverity severity, const char* full_filename,
            const char* base_filename, int line, const struct ::tm* tm_time,
            const char* message, size_t message_len) override {
    msgs.emplace_back(message, message_len);
  }
  std::vector<std::string> msgs;
};

TEST(Logging, Format) {
  AwesomeLogSink sink;
  google::AddLogSink(&sink);

  CACHEGEN_LOG_ERROR("something");
  CACHEGEN_LOG_ERROR("service [{}] has [{}] methods", "OrderCache", 2);
  CACHEGEN_LOG_WARNING_IF(false, "not logged");
  CACHEGEN_LOG_WARNING_IF(true, "logged [{}]", 1);

  ASSERT_THAT(sink.msgs, ::testing::ElementsAre(
                             "something", "service [OrderCache] has [2] methods",
                             "logged [1]"));
  google::RemoveLogSink(&sink);
}

TEST(Logging, BadFormatDoesNotThrow) {
  auto s = cachegen::internal::logging::FormatLog("file.cc", 10, "{} {}", 1);
  EXPECT_NE(std::string::npos, s.find("Failed to format log at [file.cc:10]"));
  EXPECT_NE(std::string::npos, s.find("arguments (1)"));
}

TEST(Logging, Once) {
  AwesomeLogSink sink;
  google::AddLogSink(&sink);
  for (int i = 0; i != 10; ++i) {
    CACHEGEN_LOG_ERROR_IF_ONCE(i % 2 == 1, "only once [{}]", i);
  }
  ASSERT_THAT(sink.msgs, ::testing::ElementsAre("only once [1]"));
  google::RemoveLogSink(&sink);
}

TEST(LoggingDeathTest, Check) {
  ASSERT_DEATH(CACHEGEN_CHECK(1 == 2, "bad [{}]", "thing"), "bad \\[thing\\]");
}

}  // namespace foreign_ns
