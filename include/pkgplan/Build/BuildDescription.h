//===--- BuildDescription.h - Module and product build units ----*- C++ -*-===//
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
// This file defines the descriptions a build plan hands to the command
// emitter: one per module and destination it builds, and one per product and
// destination that links a binary.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BUILD_BUILDDESCRIPTION_H
#define PKGPLAN_BUILD_BUILDDESCRIPTION_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/Build/BuildParameters.h"
#include "pkgplan/PackageGraph/ModuleAliasResolver.h"
#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <tuple>

namespace pkgplan {

/// A module together with the destination it is compiled for.
///
/// The same module may be built twice, once per destination.
struct BuildIdentity {
  ModuleID Module;
  Destination Dest;

  BuildIdentity(ModuleID module, Destination dest)
      : Module(module), Dest(dest) {}

  friend bool operator==(const BuildIdentity &lhs, const BuildIdentity &rhs) {
    return lhs.Module == rhs.Module && lhs.Dest == rhs.Dest;
  }
  friend bool operator!=(const BuildIdentity &lhs, const BuildIdentity &rhs) {
    return !(lhs == rhs);
  }
  friend bool operator<(const BuildIdentity &lhs, const BuildIdentity &rhs) {
    return std::make_tuple(lhs.Module, lhs.Dest) <
           std::make_tuple(rhs.Module, rhs.Dest);
  }
};

/// A product together with the destination it is built for.
struct ProductBuildKey {
  ProductID Product;
  Destination Dest;

  ProductBuildKey(ProductID product, Destination dest)
      : Product(product), Dest(dest) {}

  friend bool operator==(const ProductBuildKey &lhs,
                         const ProductBuildKey &rhs) {
    return lhs.Product == rhs.Product && lhs.Dest == rhs.Dest;
  }
  friend bool operator<(const ProductBuildKey &lhs,
                        const ProductBuildKey &rhs) {
    return std::make_tuple(lhs.Product, lhs.Dest) <
           std::make_tuple(rhs.Product, rhs.Dest);
  }
};

/// Everything the command emitter needs to compile one module for one
/// destination.
class ModuleBuildDescription {
  BuildIdentity Identity;
  std::string FinalName;
  ModuleAliasMap AliasMap;
  std::string BuildName;
  const BuildParameters *Parameters;

public:
  ModuleBuildDescription(BuildIdentity identity, StringRef finalName,
                         const ModuleAliasMap &aliasMap,
                         const BuildParameters &parameters)
      : Identity(identity), FinalName(finalName.str()), AliasMap(aliasMap),
        BuildName(finalName.str()), Parameters(&parameters) {}

  const BuildIdentity &getIdentity() const { return Identity; }
  ModuleID getModule() const { return Identity.Module; }
  Destination getDestination() const { return Identity.Dest; }

  /// The module name after aliasing.
  StringRef getFinalName() const { return FinalName; }

  /// The renames this module is compiled with; empty when it takes no part
  /// in module aliasing.
  const ModuleAliasMap &getAliasMap() const { return AliasMap; }

  /// The artifact name, which carries a "-tool" suffix for the host variant
  /// of a module that is also built for the target.
  StringRef getBuildName() const { return BuildName; }
  void setBuildName(StringRef name) { BuildName = name.str(); }

  const BuildParameters &getBuildParameters() const { return *Parameters; }

  /// `<build path>/<build name>.build`
  std::string getTempsPath() const;

  void print(const ResolvedGraph &graph, raw_ostream &OS) const;
};

/// A product that links a binary, built for one destination.
class ProductBuildDescription {
  ProductBuildKey Key;
  ProductKind Kind;
  std::string BuildName;
  SmallVector<BuildIdentity, 2> Modules;
  const BuildParameters *Parameters;

public:
  ProductBuildDescription(ProductBuildKey key, const Product &product,
                          ArrayRef<BuildIdentity> modules,
                          const BuildParameters &parameters)
      : Key(key), Kind(product.Kind), BuildName(product.Name),
        Modules(modules.begin(), modules.end()), Parameters(&parameters) {}

  const ProductBuildKey &getKey() const { return Key; }
  ProductID getProduct() const { return Key.Product; }
  Destination getDestination() const { return Key.Dest; }
  ProductKind getKind() const { return Kind; }

  /// The product name, with a "-tool" suffix for the host variant of a
  /// product that is also built for the target.
  StringRef getBuildName() const { return BuildName; }
  void setBuildName(StringRef name) { BuildName = name.str(); }

  /// The module builds linked into this product.
  ArrayRef<BuildIdentity> getModules() const { return Modules; }

  const BuildParameters &getBuildParameters() const { return *Parameters; }

  std::string getBinaryPath() const {
    return Parameters->getBinaryPath(BuildName, Kind);
  }

  void print(const ResolvedGraph &graph, raw_ostream &OS) const;
};

} // end namespace pkgplan

#endif // PKGPLAN_BUILD_BUILDDESCRIPTION_H
