//===--- BuildPlan.cpp - Destination-aware build plan ---------------------===//
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

#define DEBUG_TYPE "pkgplan-build-plan"
#include "pkgplan/Build/BuildPlan.h"
#include "pkgplan/Basic/DiagnosticsPlanning.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <set>

using namespace pkgplan;

STATISTIC(NumModuleBuilds, "# of module builds planned");
STATISTIC(NumHostDuplicates, "# of modules built for both destinations");
STATISTIC(NumProductBuilds, "# of product binaries planned");

/// Whether \p module uses a macro or a plugin without going through another
/// module.
static bool hasDirectMacroOrPluginDependency(const ResolvedGraph &graph,
                                             const Module &module) {
  return llvm::any_of(module.Dependencies, [&](const ModuleDependency &dep) {
    switch (dep.getKind()) {
    case ModuleDependency::Kind::Module: {
      auto kind = graph.getModule(dep.getModule()).Kind;
      return kind == ModuleKind::Macro || kind == ModuleKind::Plugin;
    }
    case ModuleDependency::Kind::Product: {
      auto kind = graph.getProduct(dep.getProduct()).Kind;
      return kind == ProductKind::Macro || kind == ProductKind::Plugin;
    }
    }
    llvm_unreachable("Unhandled ModuleDependency::Kind in switch.");
  });
}

BuildPlan::BuildPlan(const ResolvedGraph &graph,
                     const BuildParameters &destinationParameters,
                     const BuildParameters &toolsParameters,
                     ModuleAliasResolution aliases)
    : Graph(graph), DestinationParameters(destinationParameters),
      ToolsParameters(toolsParameters), Aliases(std::move(aliases)) {
  assert(DestinationParameters.getDestination() == Destination::Target &&
         "destination parameters must describe the target");
  assert(ToolsParameters.getDestination() == Destination::Host &&
         "tools parameters must describe the host");
}

Destination BuildPlan::getModuleDestination(ModuleID id,
                                            Destination inherited) const {
  const auto &module = Graph.getModule(id);
  if (isHostOnlyModuleKind(module.Kind))
    return Destination::Host;
  // Tests that expand macros or run plugins at compile time are built
  // entirely for the host.
  if (module.Kind == ModuleKind::Test &&
      hasDirectMacroOrPluginDependency(Graph, module))
    return Destination::Host;
  return inherited;
}

Destination BuildPlan::getProductDestination(ProductID id,
                                             Destination inherited) const {
  const auto &product = Graph.getProduct(id);
  if (isHostOnlyProductKind(product.Kind))
    return Destination::Host;
  if (product.Kind == ProductKind::Test &&
      llvm::any_of(product.Modules, [&](ModuleID moduleID) {
        return hasDirectMacroOrPluginDependency(Graph,
                                                Graph.getModule(moduleID));
      }))
    return Destination::Host;
  return inherited;
}

bool BuildPlan::plan(DiagnosticEngine &diags) {
  std::set<BuildIdentity> plannedModules;
  std::set<ProductBuildKey> reachedProducts;
  SmallVector<BuildIdentity, 16> moduleWorklist;
  SmallVector<ProductBuildKey, 8> productWorklist;

  auto enqueueModule = [&](ModuleID id, Destination inherited) {
    BuildIdentity identity(id, getModuleDestination(id, inherited));
    if (plannedModules.insert(identity).second)
      moduleWorklist.push_back(identity);
    return identity;
  };
  auto enqueueProduct = [&](ProductID id, Destination inherited) {
    ProductBuildKey key(id, getProductDestination(id, inherited));
    if (reachedProducts.insert(key).second)
      productWorklist.push_back(key);
  };

  for (auto productID : Graph.getRootProducts())
    enqueueProduct(productID, Destination::Target);
  for (auto moduleID : Graph.getRootModules())
    RootModules.push_back(enqueueModule(moduleID, Destination::Target));

  while (!moduleWorklist.empty() || !productWorklist.empty()) {
    if (!productWorklist.empty()) {
      auto key = productWorklist.pop_back_val();
      for (auto moduleID : Graph.getProduct(key.Product).Modules)
        enqueueModule(moduleID, key.Dest);
      continue;
    }

    auto identity = moduleWorklist.pop_back_val();
    for (const auto &dep : Graph.getModule(identity.Module).Dependencies) {
      switch (dep.getKind()) {
      case ModuleDependency::Kind::Module:
        enqueueModule(dep.getModule(), identity.Dest);
        break;
      case ModuleDependency::Kind::Product:
        enqueueProduct(dep.getProduct(), identity.Dest);
        break;
      }
    }
  }

  for (const auto &identity : plannedModules) {
    LLVM_DEBUG(llvm::dbgs() << "planning "
                            << Graph.getQualifiedName(identity.Module)
                            << " for " << getDestinationName(identity.Dest)
                            << "\n");
    ModuleDescriptions.emplace(
        identity, ModuleBuildDescription(
                      identity, Aliases.getFinalName(identity.Module),
                      Aliases.getAliasMap(identity.Module),
                      getBuildParameters(identity.Dest)));
    ++NumModuleBuilds;
  }

  // Two different modules may not be built under the same name for the same
  // destination.
  std::map<std::pair<Destination, std::string>, ModuleID> buildNames;
  for (const auto &entry : ModuleDescriptions) {
    const auto &description = entry.second;
    auto inserted = buildNames.emplace(
        std::make_pair(description.getDestination(),
                       description.getFinalName().str()),
        description.getModule());
    if (inserted.second || inserted.first->second == description.getModule())
      continue;

    const auto &existing = Graph.getModule(inserted.first->second);
    const auto &conflicting = Graph.getModule(description.getModule());
    diags.diagnose(diag::destination_conflict, existing.Name,
                   Graph.getOwner(existing).DisplayName, conflicting.Name,
                   Graph.getOwner(conflicting).DisplayName,
                   description.getFinalName(),
                   getDestinationName(description.getDestination()));
    return false;
  }

  for (auto &entry : ModuleDescriptions) {
    auto &description = entry.second;
    if (description.getDestination() != Destination::Host ||
        !ModuleDescriptions.count(
            BuildIdentity(description.getModule(), Destination::Target)))
      continue;
    description.setBuildName((description.getFinalName() + "-tool").str());
    ++NumHostDuplicates;
  }

  for (const auto &key : reachedProducts) {
    const auto &product = Graph.getProduct(key.Product);
    // Automatic libraries are linked into their clients and plugins are
    // compiled as host modules; neither produces a binary of its own.
    if (product.Kind == ProductKind::AutomaticLibrary ||
        product.Kind == ProductKind::Plugin)
      continue;

    SmallVector<BuildIdentity, 2> modules;
    for (auto moduleID : product.Modules)
      modules.push_back(
          BuildIdentity(moduleID, getModuleDestination(moduleID, key.Dest)));
    ProductDescriptions.emplace(
        key, ProductBuildDescription(key, product, modules,
                                     getBuildParameters(key.Dest)));
    ++NumProductBuilds;
  }

  for (auto &entry : ProductDescriptions) {
    auto &description = entry.second;
    if (description.getDestination() != Destination::Host ||
        !ProductDescriptions.count(
            ProductBuildKey(description.getProduct(), Destination::Target)))
      continue;
    const auto &product = Graph.getProduct(description.getProduct());
    description.setBuildName(product.Name + "-tool");
  }

  LLVM_DEBUG(print(llvm::dbgs()));
  return !diags.hadAnyError();
}

std::unique_ptr<BuildPlan>
BuildPlan::create(const ResolvedGraph &graph,
                  const BuildParameters &destinationParameters,
                  const BuildParameters &toolsParameters,
                  DiagnosticEngine &diags) {
  auto aliases = resolveModuleAliases(graph, diags);
  if (diags.hadAnyError())
    return nullptr;

  std::unique_ptr<BuildPlan> plan(new BuildPlan(
      graph, destinationParameters, toolsParameters, std::move(aliases)));
  if (!plan->plan(diags))
    return nullptr;
  return plan;
}

const ModuleBuildDescription *
BuildPlan::getModuleDescription(ModuleID module, Destination dest) const {
  auto found = ModuleDescriptions.find(BuildIdentity(module, dest));
  if (found == ModuleDescriptions.end())
    return nullptr;
  return &found->second;
}

SmallVector<const ModuleBuildDescription *, 2>
BuildPlan::getModuleDescriptions(ModuleID module) const {
  SmallVector<const ModuleBuildDescription *, 2> result;
  for (auto dest : {Destination::Host, Destination::Target})
    if (const auto *description = getModuleDescription(module, dest))
      result.push_back(description);
  return result;
}

const ProductBuildDescription *
BuildPlan::getProductDescription(ProductID product, Destination dest) const {
  auto found = ProductDescriptions.find(ProductBuildKey(product, dest));
  if (found == ProductDescriptions.end())
    return nullptr;
  return &found->second;
}

void BuildPlan::print(raw_ostream &OS) const {
  OS << "target: " << DestinationParameters.getTriple().str() << " ("
     << getBuildConfigurationName(DestinationParameters.getConfiguration())
     << ")\n";
  OS << "host: " << ToolsParameters.getTriple().str() << " ("
     << getBuildConfigurationName(ToolsParameters.getConfiguration())
     << ")\n";
  for (const auto &entry : ModuleDescriptions)
    entry.second.print(Graph, OS);
  for (const auto &entry : ProductDescriptions)
    entry.second.print(Graph, OS);
}

void BuildPlan::dump() const { print(llvm::errs()); }
