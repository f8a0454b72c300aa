//===--- pkgplan_tool_main.cpp - Print the build plan of a package graph --===//
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

#include "pkgplan/Basic/DiagnosticConsumer.h"
#include "pkgplan/Basic/DiagnosticEngine.h"
#include "pkgplan/Build/BuildPlan.h"
#include "pkgplan/PackageGraph/ResolvedGraphYAML.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Host.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <tuple>

using namespace pkgplan;

static llvm::cl::OptionCategory Category("pkgplan-tool Options");

static llvm::cl::opt<std::string>
InputFilename(llvm::cl::Positional, llvm::cl::desc("<graph.yaml>"),
              llvm::cl::Required, llvm::cl::cat(Category));

static llvm::cl::opt<std::string>
TargetTriple("target-triple",
             llvm::cl::desc("Triple the root modules are built for "
                            "(defaults to the host triple)"),
             llvm::cl::cat(Category));

static llvm::cl::opt<std::string>
HostTriple("host-triple",
           llvm::cl::desc("Triple macros, plugins and tools are built for"),
           llvm::cl::init(llvm::sys::getProcessTriple()),
           llvm::cl::cat(Category));

static llvm::cl::opt<std::string>
Configuration("configuration", llvm::cl::desc("debug or release"),
              llvm::cl::init("debug"), llvm::cl::cat(Category));

static llvm::cl::opt<std::string>
ScratchPath("scratch-path", llvm::cl::desc("Root of the build directory"),
            llvm::cl::init(".build"), llvm::cl::cat(Category));

static llvm::cl::opt<bool>
PrintTraversal("print-traversal",
               llvm::cl::desc("Print the module builds depth-first"),
               llvm::cl::cat(Category));

static llvm::cl::opt<std::string>
PrintRecursiveDependencies(
    "print-recursive-dependencies",
    llvm::cl::desc("Print everything a module depends on, given as "
                   "<module> or <package>:<module>"),
    llvm::cl::value_desc("module"), llvm::cl::cat(Category));

static llvm::cl::opt<bool>
PrintStats("print-stats", llvm::cl::desc("Print planning statistics"),
           llvm::cl::cat(Category));

static std::optional<ModuleID> lookupModule(const ResolvedGraph &graph,
                                            StringRef spelling) {
  StringRef packageName, moduleName;
  std::tie(packageName, moduleName) = spelling.split(':');
  if (moduleName.empty())
    return graph.findModule(packageName);

  auto package = graph.findPackage(packageName);
  if (!package)
    return std::nullopt;
  return graph.findModule(*package, moduleName);
}

static void printRecursiveDependencies(const BuildPlan &plan,
                                       const ModuleBuildDescription &module,
                                       raw_ostream &OS) {
  const auto &graph = plan.getGraph();
  OS << graph.getQualifiedName(module.getModule()) << " ("
     << getDestinationName(module.getDestination()) << "):\n";
  for (const auto &dep : plan.recursiveDependencies(module)) {
    if (dep.isProduct()) {
      OS << "  product " << graph.getQualifiedName(dep.getProduct()) << " ("
         << getDestinationName(dep.getDestination()) << ")";
      if (const auto *description = dep.getProductDescription())
        OS << " -> " << description->getBinaryPath();
      OS << "\n";
      continue;
    }
    const auto &description = dep.getModuleDescription();
    OS << "  module " << graph.getQualifiedName(description.getModule())
       << " as '" << description.getBuildName() << "' ("
       << getDestinationName(description.getDestination()) << ")\n";
  }
}

int main(int argc, const char **argv) {
  llvm::InitLLVM X(argc, argv);

  llvm::cl::HideUnrelatedOptions(Category);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Package Build Planner\n");

  if (PrintStats)
    llvm::EnableStatistics(/*DoPrintOnExit=*/false);

  auto configuration = parseBuildConfiguration(Configuration);
  if (!configuration) {
    llvm::errs() << "error: unknown configuration '" << Configuration
                 << "'\n";
    return 1;
  }

  std::string hostTripleName = HostTriple;
  std::string targetTripleName =
      TargetTriple.empty() ? hostTripleName : std::string(TargetTriple);
  llvm::Triple hostTriple(hostTripleName);
  llvm::Triple targetTriple(targetTripleName);
  BuildParameters toolsParameters(Destination::Host, hostTriple,
                                  *configuration, ScratchPath);
  BuildParameters destinationParameters(Destination::Target, targetTriple,
                                        *configuration, ScratchPath);

  auto graphOrError = loadResolvedGraph(InputFilename);
  if (!graphOrError) {
    llvm::errs() << "error: " << llvm::toString(graphOrError.takeError())
                 << "\n";
    return 1;
  }
  const ResolvedGraph &graph = *graphOrError;

  DiagnosticEngine diags;
  PrintingDiagnosticConsumer printer(llvm::errs());
  diags.addConsumer(printer);

  auto plan =
      BuildPlan::create(graph, destinationParameters, toolsParameters, diags);
  bool hadError = diags.finishProcessing() || !plan;
  if (PrintStats)
    llvm::PrintStatistics(llvm::errs());
  if (hadError)
    return 1;

  llvm::outs() << "module aliasing: "
               << (plan->getAliasResolution().isModuleAliasingUsed()
                       ? "used"
                       : "not used")
               << "\n";
  plan->print(llvm::outs());

  if (PrintTraversal) {
    llvm::outs() << "traversal:\n";
    plan->traverseModules([&](const ModuleBuildDescription &module,
                              const ModuleBuildDescription *parent,
                              unsigned depth) {
      llvm::outs().indent(depth * 2)
          << module.getBuildName() << " ("
          << getDestinationName(module.getDestination()) << ")\n";
    });
  }

  if (!PrintRecursiveDependencies.empty()) {
    auto module = lookupModule(graph, PrintRecursiveDependencies);
    if (!module) {
      llvm::errs() << "error: no module named '" << PrintRecursiveDependencies
                   << "'\n";
      return 1;
    }
    auto descriptions = plan->getModuleDescriptions(*module);
    if (descriptions.empty()) {
      llvm::errs() << "error: module '" << PrintRecursiveDependencies
                   << "' is not part of the build\n";
      return 1;
    }
    for (const auto *description : descriptions)
      printRecursiveDependencies(*plan, *description, llvm::outs());
  }

  return 0;
}
