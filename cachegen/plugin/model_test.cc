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

#include "cachegen/plugin/model.h"

#include "gtest/gtest.h"

#include "cachegen/plugin/errors.h"
#include "cachegen/testing/main.h"
#include "cachegen/testing/proto_file.h"

namespace cachegen::plugin {

namespace {

constexpr auto kMoneyProto = R"(
syntax = "proto3";
package example.common;
option go_package = "example.com/shop/common;commonpb";

message Money { int64 cents = 1; }
)";

constexpr auto kOrderProto = R"(
syntax = "proto3";
package example.order;
option go_package = "example.com/shop/order;orderpb";

import "common/money.proto";

message OrderReq { string id = 1; }
message OrderResp {
  message Item { string sku = 1; }
  repeated Item items = 1;
}

// Caches orders.
service OrderCache {
  // Fetches an order.
  rpc GetOrder(OrderReq) returns (OrderResp);

  rpc get_price(OrderResp.Item) returns (example.common.Money);
  rpc WatchOrder(OrderReq) returns (stream OrderResp);
}

service order_service {
}
)";

}  // namespace

TEST(FileModel, Build) {
  google::protobuf::DescriptorPool pool;
  ASSERT_TRUE(
      testing::BuildProtoFile("common/money.proto", kMoneyProto, &pool));
  auto file = testing::BuildProtoFile("order/order.proto", kOrderProto, &pool);
  ASSERT_TRUE(file);

  FileModel model;
  auto st = BuildFileModel(file, GeneratorOptions(), &model);
  ASSERT_TRUE(st.ok()) << st.ToString();

  EXPECT_EQ("order/order.proto", model.proto_path());
  EXPECT_EQ("example.com/shop/order", model.go_package().import_path);
  EXPECT_EQ("orderpb", model.go_package().name);
  EXPECT_EQ("example.com/shop/order/order", model.generated_filename_prefix());

  ASSERT_EQ(2, model.services().size());
  auto&& cache = *model.services()[0];
  EXPECT_EQ("OrderCache", cache.name());
  EXPECT_EQ(" Caches orders.\n", cache.leading_comments());
  EXPECT_EQ("OrderService", model.services()[1]->name());
  EXPECT_TRUE(model.services()[1]->methods().empty());

  ASSERT_EQ(3, cache.methods().size());
  auto&& get_order = *cache.methods()[0];
  EXPECT_EQ("GetOrder", get_order.name);
  EXPECT_EQ("example.com/shop/order", get_order.input.import_path);
  EXPECT_EQ("OrderReq", get_order.input.name);
  EXPECT_EQ("OrderResp", get_order.output.name);
  EXPECT_EQ(" Fetches an order.\n", get_order.leading_comments);
  EXPECT_EQ(&cache, get_order.parent);

  auto&& get_price = *cache.methods()[1];
  EXPECT_EQ("GetPrice", get_price.name);
  EXPECT_EQ("OrderResp_Item", get_price.input.name);
  EXPECT_EQ("example.com/shop/common", get_price.output.import_path);
  EXPECT_EQ("Money", get_price.output.name);
  EXPECT_EQ("commonpb", get_price.output.package_name);
  EXPECT_EQ("orderpb", get_price.input.package_name);
  EXPECT_EQ("", get_price.leading_comments);

  // Streaming methods are kept.
  EXPECT_EQ("WatchOrder", cache.methods()[2]->name);
}

TEST(FileModel, MissingGoPackageOfDependency) {
  google::protobuf::DescriptorPool pool;
  ASSERT_TRUE(testing::BuildProtoFile(
      "common/money.proto",
      "syntax = \"proto3\";\npackage example.common;\n"
      "message Money { int64 cents = 1; }\n",
      &pool));
  auto file = testing::BuildProtoFile("order/order.proto", kOrderProto, &pool);
  ASSERT_TRUE(file);

  FileModel model;
  auto st = BuildFileModel(file, GeneratorOptions(), &model);
  EXPECT_FALSE(st.ok());
  EXPECT_EQ(static_cast<int>(GeneratorError::MissingGoImportPath), st.code());
  EXPECT_NE(std::string::npos, st.message().find("common/money.proto"));

  // Mapping it explicitly works.
  GeneratorOptions options;
  options.import_paths["common/money.proto"] = "example.com/shop/common";
  FileModel mapped;
  ASSERT_TRUE(BuildFileModel(file, options, &mapped).ok());
  EXPECT_EQ("example.com/shop/common",
            mapped.services()[0]->methods()[1]->output.import_path);
}

TEST(FileModel, Manual) {
  FileModel model;
  model.Initialize("a.proto", {"example.com/a", "a"}, "example.com/a/a");
  auto service = model.AddService("ACache", " Hi.\n");
  auto method = service->AddMethod("Get", {"example.com/a", "Req"},
                                   {"example.com/b", "Resp"});
  ASSERT_EQ(1, model.services().size());
  EXPECT_EQ(service, model.services()[0].get());
  EXPECT_EQ(service, method->parent);
  EXPECT_EQ("Resp", service->methods()[0]->output.name);
  EXPECT_EQ("", method->leading_comments);
}

}  // namespace cachegen::plugin

CACHEGEN_TEST_MAIN
