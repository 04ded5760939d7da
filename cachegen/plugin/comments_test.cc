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

#include "cachegen/plugin/comments.h"

#include "gtest/gtest.h"

namespace cachegen::plugin {

TEST(Comments, Empty) {
  EXPECT_EQ("", FormatLeadingComments(""));
  EXPECT_EQ("", GetManagerTypeComment("OrderCacheManager", ""));
  EXPECT_EQ("", GetConstructorComment("NewOrderCacheManager", ""));
  EXPECT_EQ("", GetFetchMethodComment(""));
  EXPECT_EQ("", GetRefreshMethodComment(""));
}

TEST(Comments, FormatLeadingComments) {
  EXPECT_EQ("// Caches orders.\n", FormatLeadingComments(" Caches orders.\n"));
  EXPECT_EQ("// Line 1.\n//\n// Line 2.\n",
            FormatLeadingComments(" Line 1.\n\n Line 2.\n"));
  EXPECT_EQ("//No space.\n", FormatLeadingComments("No space."));
}

TEST(Comments, Service) {
  EXPECT_EQ(
      "// OrderCacheManager for every operation related to this service:\n"
      "// Caches orders.\n",
      GetManagerTypeComment("OrderCacheManager", " Caches orders.\n"));
  EXPECT_EQ(
      "// NewOrderCacheManager is the constructor method for this service:\n"
      "// Caches orders.\n",
      GetConstructorComment("NewOrderCacheManager", " Caches orders.\n"));
}

TEST(Comments, Fetch) {
  EXPECT_EQ("// GetFetches an order.\n",
            GetFetchMethodComment(" Fetches an order.\n"));
  EXPECT_EQ("// GetFetches an order.\n",
            GetFetchMethodComment(" Fetches an order.   \n"));
  EXPECT_EQ("// GetLine 1.\n//\n// Line 2.\n",
            GetFetchMethodComment(" Line 1.\n\n Line 2.\n"));
}

TEST(Comments, Refresh) {
  EXPECT_EQ(
      "// Eagerly refresh the cache for the method that:\n"
      "// Fetches an order.\n",
      GetRefreshMethodComment(" Fetches an order.\n"));
  EXPECT_EQ(
      "// Eagerly refresh the cache for the method that:\n"
      "// Line 1.\n"
      "// Line 2.\n",
      GetRefreshMethodComment(" Line 1.\n Line 2.\n"));
}

}  // namespace cachegen::plugin
