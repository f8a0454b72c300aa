//===--- ResolvedGraphTest.cpp --------------------------------------------===//
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

#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace pkgplan;

TEST(ResolvedGraph, RootsAndLookup) {
  ResolvedGraphBuilder builder;
  auto app = builder.addPackage("App", "/App", ToolsVersion::current(),
                                /*isRoot=*/true);
  auto dep = builder.addPackage("fooPkg", "/fooPkg");
  auto mainModule = builder.addModule(app, "Main", ModuleKind::Executable);
  auto appTests = builder.addModule(app, "MainTests", ModuleKind::Test);
  auto logging = builder.addModule(dep, "Logging");
  auto loggingProduct = builder.addProduct(
      dep, "Logging", ProductKind::AutomaticLibrary, {logging});
  builder.addProductDependency(mainModule, loggingProduct);
  builder.addModuleDependency(appTests, mainModule);
  ResolvedGraph graph = builder.take();

  auto roots = graph.getRootModules();
  ASSERT_EQ(2u, roots.size());
  EXPECT_EQ(mainModule, roots[0]);
  EXPECT_EQ(appTests, roots[1]);
  EXPECT_TRUE(graph.getRootProducts().empty());

  EXPECT_EQ(dep, graph.findPackage("FOOPKG"));
  EXPECT_FALSE(graph.findPackage("barPkg"));
  EXPECT_EQ(logging, graph.findModule("Logging"));
  EXPECT_EQ(loggingProduct, graph.findProduct(dep, "Logging"));
  EXPECT_FALSE(graph.findModule(app, "Logging"));

  EXPECT_EQ("foopkg", graph.getOwner(graph.getModule(logging)).Identity);
  EXPECT_EQ("fooPkg", graph.getOwner(graph.getModule(logging)).DisplayName);
  EXPECT_EQ("foopkg:Logging", graph.getQualifiedName(logging));
  EXPECT_EQ("foopkg:Logging", graph.getQualifiedName(loggingProduct));
}

TEST(ResolvedGraph, DependencyOrderIsKept) {
  ResolvedGraphBuilder builder;
  auto app = builder.addPackage("app", "/app", ToolsVersion::current(), true);
  auto a = builder.addModule(app, "A");
  auto b = builder.addModule(app, "B");
  auto c = builder.addModule(app, "C");
  auto product = builder.addProduct(app, "BLib", ProductKind::StaticLibrary,
                                    {b});
  builder.addModuleDependency(a, c);
  builder.addProductDependency(a, product, {ModuleAliasRequest("B", "B2")});
  ResolvedGraph graph = builder.take();

  const auto &deps = graph.getModule(a).Dependencies;
  ASSERT_EQ(2u, deps.size());
  EXPECT_TRUE(deps[0].isModule());
  EXPECT_EQ(0u, deps[0].getOrder());
  EXPECT_EQ(c, deps[0].getModule());
  EXPECT_TRUE(deps[0].getAliases().empty());
  EXPECT_TRUE(deps[1].isProduct());
  EXPECT_EQ(1u, deps[1].getOrder());
  EXPECT_EQ(product, deps[1].getProduct());
  ASSERT_EQ(1u, deps[1].getAliases().size());
  EXPECT_EQ("B2", deps[1].getAliases()[0].NewName);
}

TEST(ResolvedGraph, SourceKinds) {
  SourceKinds swiftOnly = SourceKind::Swift;
  EXPECT_TRUE(swiftOnly.areAllSubstitutable());

  SourceKinds mixed = {SourceKind::Swift, SourceKind::C};
  EXPECT_TRUE(mixed.contains(SourceKind::C));
  EXPECT_FALSE(mixed.areAllSubstitutable());
  EXPECT_FALSE(mixed == swiftOnly);
}

TEST(ResolvedGraph, HostOnlyKinds) {
  EXPECT_TRUE(isHostOnlyProductKind(ProductKind::Macro));
  EXPECT_TRUE(isHostOnlyProductKind(ProductKind::Plugin));
  EXPECT_TRUE(isHostOnlyProductKind(ProductKind::Tool));
  EXPECT_FALSE(isHostOnlyProductKind(ProductKind::Executable));
  EXPECT_TRUE(isHostOnlyModuleKind(ModuleKind::Macro));
  EXPECT_FALSE(isHostOnlyModuleKind(ModuleKind::Test));
  EXPECT_EQ("static-library", getProductKindName(ProductKind::StaticLibrary));
}

TEST(ResolvedGraph, Print) {
  ResolvedGraphBuilder builder;
  auto app = builder.addPackage("app", "/app", ToolsVersion({5, 9}), true);
  auto mainModule = builder.addModule(app, "Main", ModuleKind::Executable);
  builder.addProduct(app, "main", ProductKind::Executable, {mainModule});
  ResolvedGraph graph = builder.take();

  std::string buf;
  llvm::raw_string_ostream OS(buf);
  graph.print(OS);
  EXPECT_EQ("package app (/app, tools-version 5.9) [root]\n"
            "  module Main (executable)\n"
            "  product main (executable): Main\n",
            OS.str());
}
