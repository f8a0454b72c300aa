//===--- BuildPlanTest.cpp ------------------------------------------------===//
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

#include "pkgplan/Build/BuildPlan.h"
#include "pkgplan/Basic/DiagnosticEngine.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace pkgplan;

namespace {
class BuildPlanTest : public ::testing::Test {
protected:
  BuildParameters TargetParameters{Destination::Target,
                                   llvm::Triple("aarch64-unknown-linux-gnu"),
                                   BuildConfiguration::Debug, "/build"};
  BuildParameters HostParameters{Destination::Host,
                                 llvm::Triple("x86_64-unknown-linux-gnu"),
                                 BuildConfiguration::Debug, "/build"};
  DiagnosticEngine Diags;

  std::unique_ptr<BuildPlan> plan(const ResolvedGraph &graph) {
    return BuildPlan::create(graph, TargetParameters, HostParameters, Diags);
  }

  std::vector<std::string> getMessages() const {
    std::vector<std::string> messages;
    for (const auto &info : Diags.getEmittedDiagnostics())
      messages.push_back(info.getText());
    return messages;
  }
};

ProductID addLibrary(ResolvedGraphBuilder &builder, StringRef identity,
                     StringRef moduleName, StringRef productName,
                     SourceKinds sources = SourceKind::Swift) {
  auto package = builder.addPackage(identity, ("/" + identity).str());
  auto module = builder.addModule(package, moduleName, ModuleKind::Library,
                                  sources);
  return builder.addProduct(package, productName,
                            ProductKind::AutomaticLibrary, {module});
}
} // end anonymous namespace

TEST_F(BuildPlanTest, AliasedModulesFromTwoPackages) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("appPkg", "/appPkg",
                                   ToolsVersion::current(), true);
  auto app = builder.addModule(appPkg, "App", ModuleKind::Executable);
  builder.addProduct(appPkg, "App", ProductKind::Executable, {app});
  auto foo = addLibrary(builder, "fooPkg", "Logging", "Logging");
  auto bar = addLibrary(builder, "barPkg", "Logging", "Logging");
  builder.addProductDependency(app, foo);
  builder.addProductDependency(app, bar,
                               {ModuleAliasRequest("Logging", "BarLogging")});
  ResolvedGraph graph = builder.take();

  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);
  EXPECT_TRUE(Diags.getEmittedDiagnostics().empty());
  EXPECT_EQ(3u, buildPlan->getModuleDescriptions().size());

  auto fooLogging = graph.getProduct(foo).Modules.front();
  const auto *fooDescription =
      buildPlan->getModuleDescription(fooLogging, Destination::Target);
  ASSERT_TRUE(fooDescription);
  EXPECT_EQ("Logging", fooDescription->getBuildName());
  EXPECT_TRUE(fooDescription->getAliasMap().empty());

  auto barLogging = graph.getProduct(bar).Modules.front();
  const auto *barDescription =
      buildPlan->getModuleDescription(barLogging, Destination::Target);
  ASSERT_TRUE(barDescription);
  EXPECT_EQ("BarLogging", barDescription->getFinalName());
  EXPECT_EQ("BarLogging", barDescription->getBuildName());
  EXPECT_EQ((ModuleAliasMap{{"Logging", "BarLogging"}}),
            barDescription->getAliasMap());
  EXPECT_EQ("/build/aarch64-unknown-linux-gnu/debug/BarLogging.build",
            barDescription->getTempsPath());
  EXPECT_FALSE(buildPlan->getModuleDescription(barLogging, Destination::Host));

  ASSERT_EQ(1u, buildPlan->getProductDescriptions().size());
  const auto &product = buildPlan->getProductDescriptions().begin()->second;
  EXPECT_EQ(ProductKind::Executable, product.getKind());
  EXPECT_EQ("/build/aarch64-unknown-linux-gnu/debug/App",
            product.getBinaryPath());

  std::string buf;
  llvm::raw_string_ostream OS(buf);
  buildPlan->print(OS);
  EXPECT_NE(std::string::npos,
            OS.str().find("module barpkg:Logging [target] as BarLogging "
                          "(alias BarLogging) {Logging: BarLogging}\n"));
}

namespace {
/// App uses Core directly and through a macro, so Core is needed on both
/// sides.
ResolvedGraph makeMacroGraph() {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto app = builder.addModule(appPkg, "App", ModuleKind::Executable);
  builder.addProduct(appPkg, "App", ProductKind::Executable, {app});

  auto lib = addLibrary(builder, "libPkg", "Core", "Lib");

  auto macroPkg = builder.addPackage("macroPkg", "/macroPkg");
  auto macroImpl = builder.addModule(macroPkg, "MacroImpl", ModuleKind::Macro);
  auto macroProduct = builder.addProduct(macroPkg, "MyMacro",
                                         ProductKind::Macro, {macroImpl});
  builder.addProductDependency(macroImpl, lib);

  builder.addProductDependency(app, lib);
  builder.addProductDependency(app, macroProduct);
  return builder.take();
}
} // end anonymous namespace

TEST_F(BuildPlanTest, ModuleBuiltForBothDestinations) {
  ResolvedGraph graph = makeMacroGraph();
  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);
  EXPECT_FALSE(Diags.hadAnyError());

  auto core = *graph.findModule("Core");
  auto builds = buildPlan->getModuleDescriptions(core);
  ASSERT_EQ(2u, builds.size());

  EXPECT_EQ(Destination::Host, builds[0]->getDestination());
  EXPECT_EQ("Core-tool", builds[0]->getBuildName());
  EXPECT_EQ("Core", builds[0]->getFinalName());
  EXPECT_EQ("x86_64-unknown-linux-gnu",
            builds[0]->getBuildParameters().getTriple().str());
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/debug/Core-tool.build",
            builds[0]->getTempsPath());

  EXPECT_EQ(Destination::Target, builds[1]->getDestination());
  EXPECT_EQ("Core", builds[1]->getBuildName());
  EXPECT_EQ("aarch64-unknown-linux-gnu",
            builds[1]->getBuildParameters().getTriple().str());

  auto macroImpl = *graph.findModule("MacroImpl");
  const auto *macroDescription =
      buildPlan->getModuleDescription(macroImpl, Destination::Host);
  ASSERT_TRUE(macroDescription);
  EXPECT_EQ("MacroImpl", macroDescription->getBuildName());
  EXPECT_FALSE(buildPlan->getModuleDescription(macroImpl,
                                               Destination::Target));
  EXPECT_EQ(4u, buildPlan->getModuleDescriptions().size());

  auto macroProduct = *graph.findProduct(*graph.findPackage("macroPkg"),
                                         "MyMacro");
  const auto *macroBinary =
      buildPlan->getProductDescription(macroProduct, Destination::Host);
  ASSERT_TRUE(macroBinary);
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/debug/MyMacro",
            macroBinary->getBinaryPath());
  ASSERT_EQ(1u, macroBinary->getModules().size());
  EXPECT_EQ(Destination::Host, macroBinary->getModules()[0].Dest);

  // The automatic library links into its clients.
  auto lib = *graph.findProduct(*graph.findPackage("libPkg"), "Lib");
  EXPECT_FALSE(buildPlan->getProductDescription(lib, Destination::Target));
  EXPECT_FALSE(buildPlan->getProductDescription(lib, Destination::Host));
  EXPECT_EQ(2u, buildPlan->getProductDescriptions().size());
}

TEST_F(BuildPlanTest, DestinationRules) {
  ResolvedGraph graph = makeMacroGraph();
  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);

  auto app = *graph.findModule("App");
  auto macroImpl = *graph.findModule("MacroImpl");
  EXPECT_EQ(Destination::Target,
            buildPlan->getModuleDestination(app, Destination::Target));
  EXPECT_EQ(Destination::Host,
            buildPlan->getModuleDestination(app, Destination::Host));
  EXPECT_EQ(Destination::Host,
            buildPlan->getModuleDestination(macroImpl, Destination::Target));

  auto macroProduct = *graph.findProduct(*graph.findPackage("macroPkg"),
                                         "MyMacro");
  EXPECT_EQ(Destination::Host,
            buildPlan->getProductDestination(macroProduct,
                                             Destination::Target));
}

TEST_F(BuildPlanTest, TestsUsingMacrosRunOnTheHost) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto core = builder.addModule(appPkg, "Core");
  auto macros = builder.addModule(appPkg, "CoreMacros", ModuleKind::Macro);
  auto tests = builder.addModule(appPkg, "CoreTests", ModuleKind::Test);
  builder.addModuleDependency(tests, core);
  builder.addModuleDependency(tests, macros);
  auto testProduct =
      builder.addProduct(appPkg, "CoreTests", ProductKind::Test, {tests});
  ResolvedGraph graph = builder.take();

  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);

  EXPECT_TRUE(buildPlan->getModuleDescription(tests, Destination::Host));
  EXPECT_FALSE(buildPlan->getModuleDescription(tests, Destination::Target));
  EXPECT_TRUE(buildPlan->getModuleDescription(macros, Destination::Host));
  ASSERT_EQ(2u, buildPlan->getModuleDescriptions(core).size());
  EXPECT_EQ("Core-tool",
            buildPlan->getModuleDescription(core, Destination::Host)
                ->getBuildName());

  const auto *testBinary =
      buildPlan->getProductDescription(testProduct, Destination::Host);
  ASSERT_TRUE(testBinary);
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/debug/CoreTests.xctest",
            testBinary->getBinaryPath());
  EXPECT_FALSE(
      buildPlan->getProductDescription(testProduct, Destination::Target));
}

TEST_F(BuildPlanTest, TestsUsingPluginsRunOnTheHost) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto core = builder.addModule(appPkg, "Core");
  auto tests = builder.addModule(appPkg, "CoreTests", ModuleKind::Test);
  auto genPkg = builder.addPackage("genPkg", "/genPkg");
  auto genPlugin = builder.addModule(genPkg, "GenPlugin", ModuleKind::Plugin);
  auto gen = builder.addProduct(genPkg, "Gen", ProductKind::Plugin,
                                {genPlugin});
  builder.addModuleDependency(tests, core);
  builder.addProductDependency(tests, gen);
  auto testProduct =
      builder.addProduct(appPkg, "CoreTests", ProductKind::Test, {tests});
  ResolvedGraph graph = builder.take();

  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);

  EXPECT_TRUE(buildPlan->getModuleDescription(tests, Destination::Host));
  EXPECT_FALSE(buildPlan->getModuleDescription(tests, Destination::Target));
  EXPECT_TRUE(buildPlan->getModuleDescription(genPlugin, Destination::Host));
  EXPECT_TRUE(buildPlan->getModuleDescription(core, Destination::Host));
  EXPECT_EQ(Destination::Host,
            buildPlan->getProductDestination(testProduct,
                                             Destination::Target));
  EXPECT_TRUE(
      buildPlan->getProductDescription(testProduct, Destination::Host));
  EXPECT_FALSE(buildPlan->getProductDescription(gen, Destination::Host));
}

TEST_F(BuildPlanTest, ProductBuiltForBothDestinations) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto app = builder.addModule(appPkg, "App", ModuleKind::Executable);
  auto plugin = builder.addModule(appPkg, "GenPlugin", ModuleKind::Plugin);
  auto genPkg = builder.addPackage("genPkg", "/genPkg");
  auto genMain = builder.addModule(genPkg, "GenMain", ModuleKind::Executable);
  auto gen = builder.addProduct(genPkg, "Gen", ProductKind::Executable,
                                {genMain});
  builder.addProductDependency(app, gen);
  builder.addProductDependency(plugin, gen);
  ResolvedGraph graph = builder.take();

  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);

  const auto *target = buildPlan->getProductDescription(gen,
                                                        Destination::Target);
  const auto *host = buildPlan->getProductDescription(gen, Destination::Host);
  ASSERT_TRUE(target);
  ASSERT_TRUE(host);
  EXPECT_EQ("Gen", target->getBuildName());
  EXPECT_EQ("Gen-tool", host->getBuildName());
  EXPECT_EQ("/build/x86_64-unknown-linux-gnu/debug/Gen-tool",
            host->getBinaryPath());
  EXPECT_EQ("GenMain-tool",
            buildPlan->getModuleDescription(genMain, Destination::Host)
                ->getBuildName());
}

TEST_F(BuildPlanTest, SameNameForOneDestinationIsFatal) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto app = builder.addModule(appPkg, "App");
  auto a = addLibrary(builder, "pkgA", "Utils", "UtilsA");
  auto b = addLibrary(builder, "pkgB", "Utils", "UtilsB");
  builder.addProductDependency(app, a);
  builder.addProductDependency(app, b);
  ResolvedGraph graph = builder.take();

  EXPECT_FALSE(plan(graph));
  EXPECT_TRUE(Diags.hasFatalErrorOccurred());
  EXPECT_EQ(std::vector<std::string>{
                "modules 'Utils' from package 'pkgA' and 'Utils' from "
                "package 'pkgB' both build as 'Utils' for the target "
                "destination"},
            getMessages());
}

TEST_F(BuildPlanTest, AliasErrorsStopPlanning) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto app = builder.addModule(appPkg, "App");
  auto logging = addLibrary(builder, "fooPkg", "Logging", "Logging");
  builder.addProductDependency(app, logging,
                               {ModuleAliasRequest("Logging", "")});
  ResolvedGraph graph = builder.take();

  EXPECT_FALSE(plan(graph));
  EXPECT_EQ(1u, Diags.countDiagnostics(DiagID::module_alias_invalid));
}

TEST_F(BuildPlanTest, WarningsDoNotStopPlanning) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto app = builder.addModule(appPkg, "App");
  auto foo = addLibrary(builder, "fooPkg", "Logging", "Logging");
  auto bar = addLibrary(builder, "barPkg", "Logging", "Logging",
                        {SourceKind::Swift, SourceKind::ObjC});
  builder.addProductDependency(app, foo);
  builder.addProductDependency(app, bar,
                               {ModuleAliasRequest("Logging", "BarLogging")});
  ResolvedGraph graph = builder.take();

  auto buildPlan = plan(graph);
  ASSERT_TRUE(buildPlan);
  EXPECT_EQ(1u, Diags.countDiagnostics(
                    DiagID::module_alias_non_substitutable_sources));
  EXPECT_EQ(3u, buildPlan->getModuleDescriptions().size());
}

TEST_F(BuildPlanTest, CycleStopsPlanning) {
  ResolvedGraphBuilder builder;
  auto appPkg = builder.addPackage("app", "/app", ToolsVersion::current(),
                                   true);
  auto a = builder.addModule(appPkg, "A");
  auto b = builder.addModule(appPkg, "B");
  builder.addModuleDependency(a, b);
  builder.addModuleDependency(b, a);
  ResolvedGraph graph = builder.take();

  EXPECT_FALSE(plan(graph));
  EXPECT_EQ(1u, Diags.countDiagnostics(DiagID::dependency_cycle));
}
