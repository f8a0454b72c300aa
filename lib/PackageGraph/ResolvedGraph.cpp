//===--- ResolvedGraph.cpp - Resolved package graph -----------------------===//
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
#include "pkgplan/Basic/StringExtras.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pkgplan;

StringRef pkgplan::getModuleKindName(ModuleKind kind) {
  switch (kind) {
  case ModuleKind::Library: return "library";
  case ModuleKind::Executable: return "executable";
  case ModuleKind::Test: return "test";
  case ModuleKind::Macro: return "macro";
  case ModuleKind::Plugin: return "plugin";
  }
  llvm_unreachable("Unhandled ModuleKind in switch.");
}

StringRef pkgplan::getProductKindName(ProductKind kind) {
  switch (kind) {
  case ProductKind::AutomaticLibrary: return "library";
  case ProductKind::StaticLibrary: return "static-library";
  case ProductKind::DynamicLibrary: return "dynamic-library";
  case ProductKind::Executable: return "executable";
  case ProductKind::Macro: return "macro";
  case ProductKind::Plugin: return "plugin";
  case ProductKind::Test: return "test";
  case ProductKind::Tool: return "tool";
  }
  llvm_unreachable("Unhandled ProductKind in switch.");
}

bool pkgplan::isHostOnlyProductKind(ProductKind kind) {
  switch (kind) {
  case ProductKind::Macro:
  case ProductKind::Plugin:
  case ProductKind::Tool:
    return true;
  case ProductKind::AutomaticLibrary:
  case ProductKind::StaticLibrary:
  case ProductKind::DynamicLibrary:
  case ProductKind::Executable:
  case ProductKind::Test:
    return false;
  }
  llvm_unreachable("Unhandled ProductKind in switch.");
}

bool pkgplan::isHostOnlyModuleKind(ModuleKind kind) {
  switch (kind) {
  case ModuleKind::Macro:
  case ModuleKind::Plugin:
    return true;
  case ModuleKind::Library:
  case ModuleKind::Executable:
  case ModuleKind::Test:
    return false;
  }
  llvm_unreachable("Unhandled ModuleKind in switch.");
}

//===----------------------------------------------------------------------===//
// ResolvedGraph
//===----------------------------------------------------------------------===//

SmallVector<PackageID, 2> ResolvedGraph::getRootPackages() const {
  SmallVector<PackageID, 2> result;
  for (const auto &package : Packages)
    if (package.IsRoot)
      result.push_back(package.ID);
  return result;
}

SmallVector<ModuleID, 8> ResolvedGraph::getRootModules() const {
  SmallVector<ModuleID, 8> result;
  for (const auto &package : Packages)
    if (package.IsRoot)
      result.append(package.Modules.begin(), package.Modules.end());
  return result;
}

SmallVector<ProductID, 4> ResolvedGraph::getRootProducts() const {
  SmallVector<ProductID, 4> result;
  for (const auto &package : Packages)
    if (package.IsRoot)
      result.append(package.Products.begin(), package.Products.end());
  return result;
}

std::optional<PackageID> ResolvedGraph::findPackage(StringRef identity) const {
  auto normalized = normalizePackageIdentity(identity);
  for (const auto &package : Packages)
    if (package.Identity == normalized)
      return package.ID;
  return std::nullopt;
}

std::optional<ModuleID> ResolvedGraph::findModule(PackageID package,
                                                  StringRef name) const {
  for (auto id : getPackage(package).Modules)
    if (getModule(id).Name == name)
      return id;
  return std::nullopt;
}

std::optional<ProductID> ResolvedGraph::findProduct(PackageID package,
                                                    StringRef name) const {
  for (auto id : getPackage(package).Products)
    if (getProduct(id).Name == name)
      return id;
  return std::nullopt;
}

std::optional<ModuleID> ResolvedGraph::findModule(StringRef name) const {
  for (auto id : getRootModules())
    if (getModule(id).Name == name)
      return id;
  for (const auto &module : Modules)
    if (module.Name == name)
      return module.ID;
  return std::nullopt;
}

std::string ResolvedGraph::getQualifiedName(ModuleID id) const {
  const auto &module = getModule(id);
  return getOwner(module).Identity + ":" + module.Name;
}

std::string ResolvedGraph::getQualifiedName(ProductID id) const {
  const auto &product = getProduct(id);
  return getOwner(product).Identity + ":" + product.Name;
}

void ResolvedGraph::print(raw_ostream &OS) const {
  for (const auto &package : Packages) {
    OS << "package " << package.DisplayName << " (" << package.Location
       << ", tools-version " << package.Tools << ")";
    if (package.IsRoot)
      OS << " [root]";
    OS << "\n";

    for (auto moduleID : package.Modules) {
      const auto &module = getModule(moduleID);
      OS << "  module " << module.Name << " ("
         << getModuleKindName(module.Kind) << ")\n";
      for (const auto &dep : module.Dependencies) {
        switch (dep.getKind()) {
        case ModuleDependency::Kind::Module:
          OS << "    -> module " << getModule(dep.getModule()).Name << "\n";
          break;
        case ModuleDependency::Kind::Product:
          OS << "    -> product " << getQualifiedName(dep.getProduct());
          for (const auto &alias : dep.getAliases())
            OS << " [" << alias.OriginalName << ": " << alias.NewName << "]";
          OS << "\n";
          break;
        }
      }
    }

    for (auto productID : package.Products) {
      const auto &product = getProduct(productID);
      OS << "  product " << product.Name << " ("
         << getProductKindName(product.Kind) << "):";
      for (auto moduleID : product.Modules)
        OS << " " << getModule(moduleID).Name;
      OS << "\n";
    }
  }
}

void ResolvedGraph::dump() const { print(llvm::errs()); }

//===----------------------------------------------------------------------===//
// ResolvedGraphBuilder
//===----------------------------------------------------------------------===//

PackageID ResolvedGraphBuilder::addPackage(StringRef identity,
                                           StringRef location,
                                           ToolsVersion tools, bool isRoot) {
  assert(!Graph.findPackage(identity) && "duplicate package identity");
  PackageID id(Graph.Packages.size());
  Graph.Packages.emplace_back(id);
  auto &package = Graph.Packages.back();
  package.Identity = normalizePackageIdentity(identity);
  package.DisplayName = identity.str();
  package.Location = location.str();
  package.Tools = tools;
  package.IsRoot = isRoot;
  return id;
}

ModuleID ResolvedGraphBuilder::addModule(PackageID package, StringRef name,
                                         ModuleKind kind,
                                         SourceKinds sources) {
  assert(!Graph.findModule(package, name) && "duplicate module in package");
  ModuleID id(Graph.Modules.size());
  Graph.Modules.emplace_back(id, package);
  auto &module = Graph.Modules.back();
  module.Name = name.str();
  module.Kind = kind;
  module.Sources = sources;
  Graph.Packages[package.getIndex()].Modules.push_back(id);
  return id;
}

ProductID ResolvedGraphBuilder::addProduct(PackageID package, StringRef name,
                                           ProductKind kind,
                                           ArrayRef<ModuleID> modules) {
  assert(!Graph.findProduct(package, name) && "duplicate product in package");
  assert(llvm::all_of(modules, [&](ModuleID id) {
    return Graph.getModule(id).Owner == package;
  }) && "a product can only contain modules of its own package");
  ProductID id(Graph.Products.size());
  Graph.Products.emplace_back(id, package);
  auto &product = Graph.Products.back();
  product.Name = name.str();
  product.Kind = kind;
  product.Modules.append(modules.begin(), modules.end());
  Graph.Packages[package.getIndex()].Products.push_back(id);
  return id;
}

void ResolvedGraphBuilder::addModuleDependency(ModuleID from, ModuleID to) {
  auto &deps = Graph.Modules[from.getIndex()].Dependencies;
  deps.push_back(ModuleDependency::forModule(to, deps.size()));
}

void ResolvedGraphBuilder::addProductDependency(
    ModuleID from, ProductID to, ArrayRef<ModuleAliasRequest> aliases) {
  auto &deps = Graph.Modules[from.getIndex()].Dependencies;
  deps.push_back(ModuleDependency::forProduct(to, deps.size(), aliases));
}

ResolvedGraph ResolvedGraphBuilder::take() {
  ResolvedGraph result = std::move(Graph);
  Graph = ResolvedGraph();
  return result;
}
