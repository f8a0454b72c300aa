//===--- ModuleAliasResolver.h - Module alias resolution --------*- C++ -*-===//
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
// Module aliases let a package depend on two modules with the same name that
// come from different packages. An alias is requested on a product
// dependency and renames a module inside that product's subgraph. This file
// declares the entry point that turns those requests into a final name and
// an alias map for every reachable module.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_PACKAGEGRAPH_MODULEALIASRESOLVER_H
#define PKGPLAN_PACKAGEGRAPH_MODULEALIASRESOLVER_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/ADT/StringRef.h"
#include <map>
#include <string>
#include <vector>

namespace pkgplan {
class DiagnosticEngine;

/// Maps the original name of a module to the name it is compiled under.
///
/// Kept ordered by key so that printing and comparison are deterministic.
using ModuleAliasMap = std::map<std::string, std::string>;

/// The outcome of resolving module aliases over a ResolvedGraph.
class ModuleAliasResolution {
  struct Entry {
    bool Reachable = false;
    std::string FinalName;
    ModuleAliasMap AliasMap;
  };
  std::vector<Entry> Entries;
  bool ModuleAliasingUsed = false;

  friend class ModuleAliasResolver;

public:
  ModuleAliasResolution() = default;
  explicit ModuleAliasResolution(const ResolvedGraph &graph);

  /// Whether \p module is reachable from a module of a root package.
  bool isReachable(ModuleID module) const {
    return Entries[module.getIndex()].Reachable;
  }

  /// The name \p module is compiled under once every alias has been
  /// applied.
  StringRef getFinalName(ModuleID module) const {
    assert(isReachable(module) && "module is not part of the build");
    return Entries[module.getIndex()].FinalName;
  }

  /// The substitutions \p module needs for itself and every renamed module
  /// it reaches. Empty when the module takes part in no aliasing.
  const ModuleAliasMap &getAliasMap(ModuleID module) const {
    return Entries[module.getIndex()].AliasMap;
  }

  bool isRenamed(const ResolvedGraph &graph, ModuleID module) const {
    return isReachable(module) &&
           getFinalName(module) != graph.getModule(module).Name;
  }

  /// Whether any product dependency in the graph requests a module alias.
  bool isModuleAliasingUsed() const { return ModuleAliasingUsed; }

  void print(const ResolvedGraph &graph, raw_ostream &OS) const;
};

/// Resolve the module aliases requested anywhere in \p graph.
///
/// Problems are reported to \p diags. The returned resolution is always
/// complete for the reachable modules, but must not be used to plan a build
/// when \p diags has recorded an error.
ModuleAliasResolution resolveModuleAliases(const ResolvedGraph &graph,
                                           DiagnosticEngine &diags);

} // end namespace pkgplan

#endif // PKGPLAN_PACKAGEGRAPH_MODULEALIASRESOLVER_H
