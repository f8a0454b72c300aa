//===--- ModuleAliasResolver.cpp - Module alias resolution ----------------===//
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
//
// Aliases are resolved bottom-up. For every module we compute the set of
// modules visible through it together with the names they are visible
// under. A product dependency that carries aliases applies them as a layer
// on top of the set visible through the product, so aliases declared deeper
// in the graph are applied first and aliases closer to the root win. The
// sets of all root modules are then merged to pick one final name per
// module. A module's alias map covers every renamed module visible through
// it, so a rename requested on a product edge is inherited by everything in
// that product's subgraph that reaches the renamed module.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pkgplan-alias"
#include "pkgplan/PackageGraph/ModuleAliasResolver.h"
#include "pkgplan/Basic/DiagnosticsPlanning.h"
#include "pkgplan/Basic/StringExtras.h"
#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <set>

using namespace pkgplan;

STATISTIC(NumModulesResolved, "# of modules reachable from a root module");
STATISTIC(NumAliasesApplied, "# of module renames applied");
STATISTIC(NumRenamedModules, "# of modules built under an alias");

ModuleAliasResolution::ModuleAliasResolution(const ResolvedGraph &graph)
    : Entries(graph.getModules().size()) {}

void ModuleAliasResolution::print(const ResolvedGraph &graph,
                                  raw_ostream &OS) const {
  for (const auto &module : graph.getModules()) {
    if (!isReachable(module.ID))
      continue;
    OS << graph.getQualifiedName(module.ID) << " -> "
       << getFinalName(module.ID);
    const auto &aliasMap = getAliasMap(module.ID);
    if (!aliasMap.empty()) {
      OS << " {";
      bool first = true;
      for (const auto &entry : aliasMap) {
        if (!first)
          OS << ", ";
        OS << entry.first << ": " << entry.second;
        first = false;
      }
      OS << "}";
    }
    OS << "\n";
  }
}

namespace {
/// The names a module is visible under, each mapped to the product whose
/// aliases produced it (none for the module's own name).
using VisibleNames = std::map<std::string, std::optional<ProductID>>;

/// Every module visible through some node of the graph.
using VisibleSet = std::map<ModuleID, VisibleNames>;

void mergeVisibleSet(VisibleSet &into, const VisibleSet &from) {
  for (const auto &entry : from) {
    auto &names = into[entry.first];
    for (const auto &name : entry.second)
      names.insert(name);
  }
}
} // end anonymous namespace

namespace pkgplan {
class ModuleAliasResolver {
  const ResolvedGraph &Graph;
  DiagnosticEngine &Diags;
  ModuleAliasResolution Result;

  std::vector<std::optional<VisibleSet>> ModuleSets;
  std::vector<std::optional<VisibleSet>> ProductSets;

  /// Aliases that survived validation, keyed by (module, edge order).
  std::map<std::pair<uint32_t, unsigned>, std::vector<ModuleAliasRequest>>
      EdgeAliases;

  /// The edges in EdgeAliases whose aliases renamed at least one module.
  std::set<std::pair<uint32_t, unsigned>> AppliedEdges;

  /// The modules currently being visited, outermost first.
  SmallVector<ModuleID, 8> Stack;
  llvm::DenseSet<ModuleID> OnStack;
  bool CycleFound = false;

  std::set<std::pair<ModuleID, ProductID>> NonSubstitutableWarned;
  llvm::DenseSet<ModuleID> ToolsVersionWarned;

public:
  ModuleAliasResolver(const ResolvedGraph &graph, DiagnosticEngine &diags)
      : Graph(graph), Diags(diags), Result(graph),
        ModuleSets(graph.getModules().size()),
        ProductSets(graph.getProducts().size()) {}

  ModuleAliasResolution run();

private:
  void validateAliasRequests();
  const VisibleSet *computeModuleSet(ModuleID id);
  const VisibleSet *computeProductSet(ProductID id);
  std::optional<VisibleSet> computeProductEdge(ModuleID consumer,
                                               const ModuleDependency &dep);
  VisibleSet applyAliasLayer(const VisibleSet &base,
                             ArrayRef<ModuleAliasRequest> aliases,
                             ProductID product, bool &renamedAny);
  void diagnoseCycle(ModuleID id);
  void chooseFinalNames(const VisibleSet &reachable);
  void buildAliasMap(ModuleID id);
  void checkDuplicateProducts();

  const Module &getModule(ModuleID id) const { return Graph.getModule(id); }
};
} // end namespace pkgplan

void ModuleAliasResolver::validateAliasRequests() {
  for (const auto &module : Graph.getModules()) {
    // (package, original name) -> first alias requested for it and the
    // product it was requested on.
    std::map<std::pair<PackageID, std::string>,
             std::pair<std::string, ProductID>> requested;

    for (const auto &dep : module.Dependencies) {
      if (!dep.isProduct() || dep.getAliases().empty())
        continue;
      Result.ModuleAliasingUsed = true;

      const auto &product = Graph.getProduct(dep.getProduct());
      std::vector<ModuleAliasRequest> accepted;
      bool valid = true;
      for (const auto &alias : dep.getAliases()) {
        if (!isValidModuleName(alias.NewName)) {
          Diags.diagnose(diag::module_alias_invalid, alias.OriginalName,
                         alias.NewName, module.Name);
          valid = false;
          continue;
        }
        if (alias.OriginalName == alias.NewName)
          continue;
        if (llvm::any_of(accepted, [&](const ModuleAliasRequest &existing) {
              return existing.OriginalName == alias.OriginalName;
            }))
          continue;
        accepted.push_back(alias);
      }
      if (!valid)
        continue;

      // Two product dependencies into the same package must agree on how
      // they rename a module, otherwise the package's own build is
      // ambiguous.
      bool ambiguous = false;
      for (const auto &alias : accepted) {
        auto key = std::make_pair(product.Owner, alias.OriginalName);
        auto inserted = requested.emplace(
            key, std::make_pair(alias.NewName, product.ID));
        if (inserted.second || inserted.first->second.first == alias.NewName)
          continue;
        std::string names[] = {inserted.first->second.first, alias.NewName};
        Diags.diagnose(diag::module_alias_ambiguous_in_product, names,
                       alias.OriginalName, product.Name,
                       Graph.getOwner(product).DisplayName);
        ambiguous = true;
      }
      if (ambiguous || accepted.empty())
        continue;

      EdgeAliases[{module.ID.getIndex(), dep.getOrder()}] =
          std::move(accepted);
    }
  }
}

void ModuleAliasResolver::diagnoseCycle(ModuleID id) {
  CycleFound = true;
  SmallString<128> path;
  llvm::raw_svector_ostream OS(path);
  auto start = llvm::find(Stack, id);
  for (auto it = start; it != Stack.end(); ++it)
    OS << getModule(*it).Name << " -> ";
  OS << getModule(id).Name;
  Diags.diagnose(diag::dependency_cycle, OS.str());
}

const VisibleSet *ModuleAliasResolver::computeModuleSet(ModuleID id) {
  auto &memo = ModuleSets[id.getIndex()];
  if (memo)
    return &*memo;

  if (OnStack.count(id)) {
    diagnoseCycle(id);
    return nullptr;
  }
  Stack.push_back(id);
  OnStack.insert(id);

  const auto &module = getModule(id);
  VisibleSet result;
  result[id].emplace(module.Name, std::nullopt);

  for (const auto &dep : module.Dependencies) {
    switch (dep.getKind()) {
    case ModuleDependency::Kind::Module: {
      const auto *depSet = computeModuleSet(dep.getModule());
      if (!depSet)
        return nullptr;
      mergeVisibleSet(result, *depSet);
      break;
    }
    case ModuleDependency::Kind::Product: {
      auto layered = computeProductEdge(id, dep);
      if (!layered)
        return nullptr;
      mergeVisibleSet(result, *layered);
      break;
    }
    }
  }

  OnStack.erase(id);
  Stack.pop_back();
  memo = std::move(result);
  return &*memo;
}

const VisibleSet *ModuleAliasResolver::computeProductSet(ProductID id) {
  auto &memo = ProductSets[id.getIndex()];
  if (memo)
    return &*memo;

  VisibleSet result;
  for (auto moduleID : Graph.getProduct(id).Modules) {
    const auto *moduleSet = computeModuleSet(moduleID);
    if (!moduleSet)
      return nullptr;
    mergeVisibleSet(result, *moduleSet);
  }
  memo = std::move(result);
  return &*memo;
}

std::optional<VisibleSet>
ModuleAliasResolver::computeProductEdge(ModuleID consumer,
                                        const ModuleDependency &dep) {
  const auto *base = computeProductSet(dep.getProduct());
  if (!base)
    return std::nullopt;

  std::pair<uint32_t, unsigned> edge(consumer.getIndex(), dep.getOrder());
  auto aliases = EdgeAliases.find(edge);
  if (aliases == EdgeAliases.end())
    return *base;

  LLVM_DEBUG(llvm::dbgs() << "applying " << aliases->second.size()
                          << " alias(es) requested by "
                          << Graph.getQualifiedName(consumer) << " on "
                          << Graph.getQualifiedName(dep.getProduct())
                          << "\n");
  bool renamedAny = false;
  auto layered =
      applyAliasLayer(*base, aliases->second, dep.getProduct(), renamedAny);
  if (renamedAny)
    AppliedEdges.insert(edge);
  return layered;
}

VisibleSet
ModuleAliasResolver::applyAliasLayer(const VisibleSet &base,
                                     ArrayRef<ModuleAliasRequest> aliases,
                                     ProductID productID, bool &renamedAny) {
  const auto &product = Graph.getProduct(productID);
  const auto &productPackage = Graph.getOwner(product);

  std::map<std::string, std::string> layer;
  for (const auto &alias : aliases)
    layer.emplace(alias.OriginalName, alias.NewName);

  std::set<std::string> currentNames;
  for (const auto &entry : base)
    for (const auto &name : entry.second)
      currentNames.insert(name.first);

  std::set<std::string> usedKeys;
  VisibleSet result;
  for (const auto &entry : base) {
    const auto &module = getModule(entry.first);
    auto &names = result[entry.first];

    for (const auto &name : entry.second) {
      std::string newName;
      auto byCurrentName = layer.find(name.first);
      if (byCurrentName != layer.end()) {
        newName = byCurrentName->second;
        usedKeys.insert(byCurrentName->first);
      } else if (name.first != module.Name &&
                 !currentNames.count(module.Name)) {
        // An alias for the original name overrides an upstream rename as
        // long as nothing else in this product still uses that name.
        auto byOriginalName = layer.find(module.Name);
        if (byOriginalName != layer.end()) {
          newName = byOriginalName->second;
          usedKeys.insert(byOriginalName->first);
        }
      }

      if (newName.empty() || newName == name.first) {
        names.insert(name);
        continue;
      }

      const auto &modulePackage = Graph.getOwner(module);
      if (!modulePackage.Tools.supportsModuleAliasing()) {
        if (ToolsVersionWarned.insert(module.ID).second)
          Diags.diagnose(diag::module_aliasing_requires_tools_version,
                         ToolsVersion::minimumForModuleAliasing()
                             .getAsString(),
                         module.Name, modulePackage.DisplayName);
        names.insert(name);
        continue;
      }

      if (!module.Sources.areAllSubstitutable() &&
          NonSubstitutableWarned.insert({module.ID, productID}).second)
        Diags.diagnose(diag::module_alias_non_substitutable_sources,
                       module.Name, product.Name, productPackage.DisplayName);

      LLVM_DEBUG(llvm::dbgs() << "  " << Graph.getQualifiedName(module.ID)
                              << ": " << name.first << " -> " << newName
                              << "\n");
      ++NumAliasesApplied;
      renamedAny = true;
      names.emplace(newName, productID);
    }
  }

  for (const auto &alias : aliases) {
    if (!usedKeys.count(alias.OriginalName))
      Diags.diagnose(diag::module_alias_unapplied, alias.OriginalName,
                     alias.NewName, product.Name, productPackage.DisplayName);
  }
  return result;
}

void ModuleAliasResolver::chooseFinalNames(const VisibleSet &reachable) {
  for (const auto &entry : reachable) {
    const auto &module = getModule(entry.first);
    auto &resolved = Result.Entries[entry.first.getIndex()];
    resolved.Reachable = true;
    ++NumModulesResolved;

    // An unaliased path keeps the original name only when no other path
    // supplies a rename.
    SmallVector<std::pair<std::string, ProductID>, 2> renames;
    for (const auto &name : entry.second) {
      if (name.first == module.Name)
        continue;
      assert(name.second && "renamed without a product boundary");
      renames.push_back({name.first, *name.second});
    }

    if (renames.empty()) {
      resolved.FinalName = module.Name;
      continue;
    }

    resolved.FinalName = renames.front().first;
    ++NumRenamedModules;
    if (renames.size() == 1)
      continue;

    std::vector<std::string> names;
    for (const auto &rename : renames)
      names.push_back(rename.first);
    const auto &product = Graph.getProduct(renames.front().second);
    Diags.diagnose(diag::module_alias_conflict, names, module.Name,
                   product.Name, Graph.getOwner(product).DisplayName);
  }
}

void ModuleAliasResolver::buildAliasMap(ModuleID id) {
  const auto &module = getModule(id);
  auto &aliasMap = Result.Entries[id.getIndex()].AliasMap;

  auto addEntry = [&](StringRef key, StringRef value) {
    auto inserted = aliasMap.emplace(key.str(), value.str());
    if (!inserted.second) {
      if (inserted.first->second != value) {
        std::string values[] = {inserted.first->second, value.str()};
        Diags.diagnose(diag::module_alias_map_conflict, module.Name, key,
                       values);
      }
      return;
    }
    for (const auto &existing : aliasMap) {
      if (existing.first != key && existing.second == value) {
        std::string keys[] = {existing.first, key.str()};
        Diags.diagnose(diag::module_alias_map_conflict, module.Name, value,
                       keys);
        return;
      }
    }
  };

  if (Result.isRenamed(Graph, id))
    addEntry(module.Name, Result.getFinalName(id));

  const auto &visible = *ModuleSets[id.getIndex()];
  for (const auto &entry : visible) {
    auto depID = entry.first;
    const auto &depName = getModule(depID).Name;
    if (depID == id || !Result.isRenamed(Graph, depID))
      continue;
    StringRef finalName = Result.getFinalName(depID);

    bool sharesName = llvm::any_of(visible, [&](const auto &other) {
      return other.first != depID && getModule(other.first).Name == depName;
    });
    if (!sharesName || entry.second.count(depName)) {
      addEntry(depName, finalName);
      continue;
    }

    // The original name refers to another module here; fall back to the
    // name this module sees the dependency under, unless that already is
    // the final name.
    auto localName = llvm::find_if(entry.second, [&](const auto &name) {
      return name.first != depName;
    });
    assert(localName != entry.second.end() && "renamed module has no alias");
    if (localName->first != finalName)
      addEntry(localName->first, finalName);
  }
}

void ModuleAliasResolver::checkDuplicateProducts() {
  struct ProductGroup {
    std::set<PackageID> Packages;
    bool AliasedUse = false;
  };
  std::map<std::string, ProductGroup> groups;

  for (const auto &module : Graph.getModules()) {
    if (!Result.isReachable(module.ID))
      continue;
    for (const auto &dep : module.Dependencies) {
      if (!dep.isProduct())
        continue;
      const auto &product = Graph.getProduct(dep.getProduct());
      auto &group = groups[product.Name];
      group.Packages.insert(product.Owner);
      // Only aliases that renamed something disambiguate the product.
      if (AppliedEdges.count({module.ID.getIndex(), dep.getOrder()}))
        group.AliasedUse = true;
    }
  }

  for (const auto &entry : groups) {
    const auto &group = entry.second;
    if (group.Packages.size() < 2)
      continue;

    bool allSupportAliasing =
        llvm::all_of(group.Packages, [&](PackageID id) {
          return Graph.getPackage(id).Tools.supportsProductAliasing();
        });
    if (group.AliasedUse && allSupportAliasing)
      continue;

    std::vector<std::string> identities;
    for (auto id : group.Packages)
      identities.push_back(Graph.getPackage(id).Identity);
    llvm::sort(identities);

    if (Result.ModuleAliasingUsed) {
      for (const auto &identity : identities) {
        auto id = *Graph.findPackage(identity);
        if (!Graph.getPackage(id).Tools.supportsProductAliasing())
          Diags.diagnose(diag::product_aliasing_requires_tools_version,
                         ToolsVersion::minimumForProductAliasing()
                             .getAsString(),
                         identity);
      }
    }
    Diags.diagnose(diag::duplicate_product_name, entry.first, identities);
  }
}

ModuleAliasResolution ModuleAliasResolver::run() {
  validateAliasRequests();

  VisibleSet reachable;
  for (auto root : Graph.getRootModules()) {
    const auto *rootSet = computeModuleSet(root);
    if (!rootSet) {
      assert(CycleFound && "only a cycle stops resolution");
      return std::move(Result);
    }
    mergeVisibleSet(reachable, *rootSet);
  }

  chooseFinalNames(reachable);
  for (const auto &entry : reachable)
    buildAliasMap(entry.first);
  checkDuplicateProducts();

  LLVM_DEBUG(Result.print(Graph, llvm::dbgs()));
  return std::move(Result);
}

ModuleAliasResolution pkgplan::resolveModuleAliases(const ResolvedGraph &graph,
                                                    DiagnosticEngine &diags) {
  return ModuleAliasResolver(graph, diags).run();
}
