//===--- BuildParametersTest.cpp ------------------------------------------===//
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

#include "pkgplan/Build/BuildParameters.h"
#include "gtest/gtest.h"

using namespace pkgplan;

static BuildParameters makeParameters(StringRef triple,
                                      BuildConfiguration configuration =
                                          BuildConfiguration::Debug) {
  return BuildParameters(Destination::Target, llvm::Triple(triple),
                         configuration, "/build");
}

TEST(BuildParameters, Paths) {
  auto params = makeParameters("x86_64-unknown-linux-gnu",
                              BuildConfiguration::Release);
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu", params.getDataPath());
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/release", params.getBuildPath());
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/release/App",
            params.getBinaryPath("App", ProductKind::Executable));
}

TEST(BuildParameters, LinuxBinaries) {
  auto params = makeParameters("aarch64-unknown-linux-gnu");
  EXPECT_EQ("App",
            params.getBinaryRelativePath("App", ProductKind::Executable));
  EXPECT_EQ("Gen", params.getBinaryRelativePath("Gen", ProductKind::Tool));
  EXPECT_EQ("libCore.a",
            params.getBinaryRelativePath("Core", ProductKind::StaticLibrary));
  EXPECT_EQ("libCore.so",
            params.getBinaryRelativePath("Core", ProductKind::DynamicLibrary));
  EXPECT_EQ("AppTests.xctest",
            params.getBinaryRelativePath("AppTests", ProductKind::Test));
}

TEST(BuildParameters, DarwinBinaries) {
  auto params = makeParameters("arm64-apple-macosx14.0");
  EXPECT_EQ("libCore.dylib",
            params.getBinaryRelativePath("Core", ProductKind::DynamicLibrary));
  EXPECT_EQ("AppTests.xctest/Contents/MacOS/AppTests",
            params.getBinaryRelativePath("AppTests", ProductKind::Test));
}

TEST(BuildParameters, WindowsBinaries) {
  auto params = makeParameters("x86_64-unknown-windows-msvc");
  EXPECT_EQ("App.exe",
            params.getBinaryRelativePath("App", ProductKind::Executable));
  EXPECT_EQ("Core.dll",
            params.getBinaryRelativePath("Core", ProductKind::DynamicLibrary));
  EXPECT_EQ("libCore.lib",
            params.getBinaryRelativePath("Core", ProductKind::StaticLibrary));
}

TEST(BuildParameters, WASIBinaries) {
  auto params = makeParameters("wasm32-unknown-wasi");
  EXPECT_EQ("App.wasm",
            params.getBinaryRelativePath("App", ProductKind::Executable));
  EXPECT_EQ("AppTests.wasm",
            params.getBinaryRelativePath("AppTests", ProductKind::Test));
}

TEST(BuildParameters, Configuration) {
  EXPECT_EQ(BuildConfiguration::Debug, parseBuildConfiguration("debug"));
  EXPECT_EQ(BuildConfiguration::Release, parseBuildConfiguration("release"));
  EXPECT_FALSE(parseBuildConfiguration("Release"));
  EXPECT_EQ("release",
            getBuildConfigurationName(BuildConfiguration::Release));
  EXPECT_EQ("host", getDestinationName(Destination::Host));
}
