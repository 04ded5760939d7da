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

#include "cachegen/plugin/generated_file.h"

#include <string>

#include "gtest/gtest.h"

namespace cachegen::plugin {

TEST(GeneratedFile, QualifiedGoIdent) {
  GeneratedFile file("example.com/shop/order/order_cache_manager.pb.go",
                     "order/order.proto", {"example.com/shop/order", "orderpb"});
  EXPECT_EQ("OrderReq",
            file.QualifiedGoIdent({"example.com/shop/order", "OrderReq"}));
  EXPECT_EQ("context.Context", file.QualifiedGoIdent({"context", "Context"}));
  EXPECT_EQ("common.Money",
            file.QualifiedGoIdent({"example.com/shop/common", "Money"}));
  EXPECT_EQ("common.Currency",
            file.QualifiedGoIdent({"example.com/shop/common", "Currency"}));

  // Same base name, different path.
  EXPECT_EQ("common1.Money",
            file.QualifiedGoIdent({"example.com/lib/common", "Money"}));
  EXPECT_EQ("order_v2.Order",
            file.QualifiedGoIdent({"example.com/shop/order-v2", "Order"}));
}

TEST(GeneratedFile, RenderEmpty) {
  GeneratedFile file("a/a_cache_manager.pb.go", "a.proto", {"a", "apb"});
  EXPECT_EQ(
      "// Code generated by protoc-gen-go-cache-manager. DO NOT EDIT.\n"
      "// source: a.proto\n"
      "\n"
      "package apb\n"
      "\n",
      file.Render());
}

TEST(GeneratedFile, Render) {
  GeneratedFile file("x.go", "shop/order.proto",
                     {"example.com/shop/order", "orderpb"});
  auto money = file.QualifiedGoIdent({"example.com/shop/common", "Money"});
  auto lib = file.QualifiedGoIdent({"example.com/lib/common", "Money"});
  auto errorf = file.QualifiedGoIdent({"fmt", "Errorf"});
  auto context = file.QualifiedGoIdent({"context", "Context"});
  auto v2 = file.QualifiedGoIdent({"example.com/shop/order-v2", "Order"});
  file.Append("var a " + money + "\n");
  file.Append("var b " + lib + "\n");
  file.Append("var c = " + errorf + "\nvar d " + context + "\nvar e " + v2 +
              "\n");
  ASSERT_EQ(3, file.fragments().size());

  EXPECT_EQ(
      "// Code generated by protoc-gen-go-cache-manager. DO NOT EDIT.\n"
      "// source: shop/order.proto\n"
      "\n"
      "package orderpb\n"
      "\n"
      "import (\n"
      "\t\"context\"\n"
      "\t\"fmt\"\n"
      "\n"
      "\tcommon1 \"example.com/lib/common\"\n"
      "\tcommon \"example.com/shop/common\"\n"
      "\torder_v2 \"example.com/shop/order-v2\"\n"
      ")\n"
      "\n"
      "var a common.Money\n"
      "\n"
      "var b common1.Money\n"
      "\n"
      "var c = fmt.Errorf\n"
      "var d context.Context\n"
      "var e order_v2.Order\n",
      file.Render());
}

TEST(GeneratedFile, DeclaredPackageName) {
  GeneratedFile file("x.go", "shop/order.proto",
                     {"example.com/shop/order", "orderpb"});
  EXPECT_EQ("commonpb.User",
            file.QualifiedGoIdent({"example.com/shop/common", "User",
                                   "commonpb"}));
  // Same package, the name picked the first time is kept.
  EXPECT_EQ("commonpb.Money",
            file.QualifiedGoIdent({"example.com/shop/common", "Money"}));
  EXPECT_EQ("commonpb1.Money",
            file.QualifiedGoIdent({"example.com/lib/common", "Money",
                                   "commonpb"}));
  file.Append("var a commonpb.User\n");

  auto rendered = file.Render();
  EXPECT_NE(std::string::npos,
            rendered.find("\tcommonpb1 \"example.com/lib/common\"\n"
                          "\tcommonpb \"example.com/shop/common\"\n"));
  EXPECT_EQ(std::string::npos, rendered.find("\t\"example.com/shop/common\""));
}

TEST(GeneratedFile, LocalIdentifiersAreNotPackageNames) {
  GeneratedFile file("x.go", "shop/order.proto",
                     {"example.com/shop/order", "orderpb"});
  EXPECT_EQ("options1.Req",
            file.QualifiedGoIdent({"example.com/shop/options", "Req"}));
  EXPECT_EQ("input1.Req",
            file.QualifiedGoIdent({"example.com/shop/x", "Req", "input"}));
  EXPECT_EQ("err1.Req", file.QualifiedGoIdent({"example.com/err", "Req"}));
  EXPECT_EQ("ctx1.Req", file.QualifiedGoIdent({"example.com/ctx", "Req"}));
  EXPECT_EQ("cm1.Req", file.QualifiedGoIdent({"example.com/cm", "Req"}));
  file.Append("var a options1.Req\n");

  EXPECT_NE(std::string::npos,
            file.Render().find("\toptions1 \"example.com/shop/options\"\n"));
}

}  // namespace cachegen::plugin
