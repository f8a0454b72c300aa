//===--- ToolsVersionTest.cpp ---------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2017 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See https://swift.org/LICENSE.txt for license information
// See https://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "pkgplan/Basic/ToolsVersion.h"
#include "gtest/gtest.h"

using namespace pkgplan;

TEST(ToolsVersion, Parse) {
  auto version = ToolsVersion::parse("5.7.1");
  ASSERT_TRUE(version.has_value());
  EXPECT_EQ(3u, version->size());
  EXPECT_EQ(5u, version->getMajor());
  EXPECT_EQ(7u, version->getMinor());
  EXPECT_EQ("5.7.1", version->getAsString());

  EXPECT_FALSE(ToolsVersion::parse(""));
  EXPECT_FALSE(ToolsVersion::parse("5."));
  EXPECT_FALSE(ToolsVersion::parse(".5"));
  EXPECT_FALSE(ToolsVersion::parse("5.x"));
  EXPECT_FALSE(ToolsVersion::parse("1.2.3.4"));
}

TEST(ToolsVersion, MissingComponentsCompareAsZero) {
  EXPECT_EQ(ToolsVersion({5, 7}), ToolsVersion({5, 7, 0}));
  EXPECT_TRUE(ToolsVersion({5, 6, 9}) < ToolsVersion({5, 7}));
  EXPECT_TRUE(ToolsVersion({6}) >= ToolsVersion({5, 10}));
  EXPECT_NE(ToolsVersion({5, 9}), ToolsVersion({5, 10}));
}

TEST(ToolsVersion, EmptyIsNewest) {
  ToolsVersion latest;
  EXPECT_TRUE(latest >= ToolsVersion({99, 0}));
  EXPECT_TRUE(latest.supportsModuleAliasing());
}

TEST(ToolsVersion, AliasingGates) {
  EXPECT_FALSE(ToolsVersion({5, 1}).supportsProductAliasing());
  EXPECT_TRUE(ToolsVersion({5, 2}).supportsProductAliasing());
  EXPECT_FALSE(ToolsVersion({5, 6}).supportsModuleAliasing());
  EXPECT_TRUE(ToolsVersion({5, 7}).supportsModuleAliasing());
  EXPECT_TRUE(ToolsVersion::current().supportsModuleAliasing());
}
