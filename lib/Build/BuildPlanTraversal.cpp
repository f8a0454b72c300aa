//===--- BuildPlanTraversal.cpp - Walking a planned build -----------------===//
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
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include <functional>
#include <set>
#include <tuple>

using namespace pkgplan;

namespace {
/// Walks module builds depth-first, remembering what has been expanded and
/// what is currently on the path from a root.
class ModuleWalker {
  const BuildPlan &Plan;
  BuildPlan::ModuleVisitor Visit;
  std::set<BuildIdentity> Expanded;
  std::set<BuildIdentity> OnStack;

public:
  ModuleWalker(const BuildPlan &plan, BuildPlan::ModuleVisitor visit)
      : Plan(plan), Visit(visit) {}

  void walk(BuildIdentity identity, const ModuleBuildDescription *parent,
            unsigned depth) {
    const auto *description =
        Plan.getModuleDescription(identity.Module, identity.Dest);
    assert(description && "traversal reached a module that was not planned");

    if (OnStack.count(identity)) {
      const auto &graph = Plan.getGraph();
      llvm::report_fatal_error(
          llvm::Twine("dependency cycle through '") +
          graph.getQualifiedName(identity.Module) + "'");
    }

    Visit(*description, parent, depth);
    if (!Expanded.insert(identity).second)
      return;

    OnStack.insert(identity);
    const auto &graph = Plan.getGraph();
    for (const auto &dep : graph.getModule(identity.Module).Dependencies) {
      switch (dep.getKind()) {
      case ModuleDependency::Kind::Module: {
        auto child = dep.getModule();
        walk(BuildIdentity(child,
                           Plan.getModuleDestination(child, identity.Dest)),
             description, depth + 1);
        break;
      }
      case ModuleDependency::Kind::Product: {
        auto productDest =
            Plan.getProductDestination(dep.getProduct(), identity.Dest);
        for (auto child : graph.getProduct(dep.getProduct()).Modules)
          walk(BuildIdentity(child,
                             Plan.getModuleDestination(child, productDest)),
               description, depth + 1);
        break;
      }
      }
    }
    OnStack.erase(identity);
  }
};
} // end anonymous namespace

void BuildPlan::traverseModules(ModuleVisitor visit) const {
  ModuleWalker walker(*this, visit);
  for (const auto &root : RootModules)
    walker.walk(root, nullptr, 1);
}

void BuildPlan::traverseDependencies(const ModuleBuildDescription &module,
                                     ProductCallback onProduct,
                                     ModuleCallback onModule) const {
  auto dest = module.getDestination();
  for (const auto &dep : Graph.getModule(module.getModule()).Dependencies) {
    switch (dep.getKind()) {
    case ModuleDependency::Kind::Module: {
      auto child = dep.getModule();
      const auto *description =
          getModuleDescription(child, getModuleDestination(child, dest));
      assert(description && "dependency was not planned");
      onModule(*description);
      break;
    }
    case ModuleDependency::Kind::Product: {
      auto productDest = getProductDestination(dep.getProduct(), dest);
      onProduct(Graph.getProduct(dep.getProduct()), productDest,
                getProductDescription(dep.getProduct(), productDest));
      break;
    }
    }
  }
}

std::vector<PlannedDependency>
BuildPlan::recursiveDependencies(const ModuleBuildDescription &module) const {
  using SeenKey = std::tuple<PlannedDependency::Kind, unsigned, Destination>;
  std::set<SeenKey> seen;
  std::vector<PlannedDependency> result;

  // Recursion depth is bounded by the longest dependency chain, which is
  // acyclic once aliases have been resolved.
  std::function<void(const ModuleBuildDescription &)> collect;
  auto addModule = [&](ModuleID id, Destination dest) {
    SeenKey key(PlannedDependency::Kind::Module, id.getIndex(), dest);
    if (!seen.insert(key).second)
      return;
    const auto *description = getModuleDescription(id, dest);
    assert(description && "dependency was not planned");
    result.push_back(PlannedDependency::forModule(*description));
    collect(*description);
  };

  collect = [&](const ModuleBuildDescription &current) {
    auto dest = current.getDestination();
    for (const auto &dep :
         Graph.getModule(current.getModule()).Dependencies) {
      switch (dep.getKind()) {
      case ModuleDependency::Kind::Module:
        addModule(dep.getModule(),
                  getModuleDestination(dep.getModule(), dest));
        break;
      case ModuleDependency::Kind::Product: {
        auto productID = dep.getProduct();
        auto productDest = getProductDestination(productID, dest);
        SeenKey key(PlannedDependency::Kind::Product, productID.getIndex(),
                    productDest);
        if (seen.insert(key).second)
          result.push_back(PlannedDependency::forProduct(
              productID, productDest,
              getProductDescription(productID, productDest)));
        for (auto child : Graph.getProduct(productID).Modules)
          addModule(child, getModuleDestination(child, productDest));
        break;
      }
      }
    }
  };

  // The starting module is never reported as its own dependency.
  seen.insert(SeenKey(PlannedDependency::Kind::Module,
                      module.getModule().getIndex(), module.getDestination()));
  collect(module);
  return result;
}
