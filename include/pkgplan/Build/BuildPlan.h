//===--- BuildPlan.h - Destination-aware build plan -------------*- C++ -*-===//
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
// A BuildPlan decides which modules and products are built, and for which
// destination. Macros, plugins and build tools run on the host, so they and
// everything they depend on are built for the host; a module needed by both
// sides is built twice.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BUILD_BUILDPLAN_H
#define PKGPLAN_BUILD_BUILDPLAN_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/Build/BuildDescription.h"
#include "pkgplan/Build/BuildParameters.h"
#include "pkgplan/PackageGraph/ModuleAliasResolver.h"
#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/SmallVector.h"
#include <map>
#include <memory>
#include <vector>

namespace pkgplan {
class DiagnosticEngine;

/// One entry of BuildPlan::recursiveDependencies.
class PlannedDependency {
public:
  enum class Kind : uint8_t {
    Product,
    Module,
  };

private:
  Kind TheKind;
  Destination Dest;
  ProductID Product;
  const ModuleBuildDescription *ModuleDescription;
  const ProductBuildDescription *ProductDescription;

  PlannedDependency(Kind kind, Destination dest, ProductID product,
                    const ModuleBuildDescription *module,
                    const ProductBuildDescription *productDescription)
      : TheKind(kind), Dest(dest), Product(product),
        ModuleDescription(module), ProductDescription(productDescription) {}

public:
  static PlannedDependency
  forProduct(ProductID product, Destination dest,
             const ProductBuildDescription *description) {
    return PlannedDependency(Kind::Product, dest, product, nullptr,
                             description);
  }

  static PlannedDependency forModule(const ModuleBuildDescription &module) {
    return PlannedDependency(Kind::Module, module.getDestination(),
                             ProductID(~0U), &module, nullptr);
  }

  Kind getKind() const { return TheKind; }
  bool isProduct() const { return TheKind == Kind::Product; }
  bool isModule() const { return TheKind == Kind::Module; }
  Destination getDestination() const { return Dest; }

  ProductID getProduct() const {
    assert(isProduct() && "not a product dependency");
    return Product;
  }

  /// The product's own description, if it links a binary.
  const ProductBuildDescription *getProductDescription() const {
    assert(isProduct() && "not a product dependency");
    return ProductDescription;
  }

  const ModuleBuildDescription &getModuleDescription() const {
    assert(isModule() && "not a module dependency");
    return *ModuleDescription;
  }
};

class BuildPlan {
public:
  using ModuleVisitor =
      function_ref<void(const ModuleBuildDescription &module,
                        const ModuleBuildDescription *parent,
                        unsigned depth)>;
  using ProductCallback =
      function_ref<void(const Product &product, Destination dest,
                        const ProductBuildDescription *description)>;
  using ModuleCallback =
      function_ref<void(const ModuleBuildDescription &module)>;

private:
  const ResolvedGraph &Graph;
  BuildParameters DestinationParameters;
  BuildParameters ToolsParameters;
  ModuleAliasResolution Aliases;

  std::map<BuildIdentity, ModuleBuildDescription> ModuleDescriptions;
  std::map<ProductBuildKey, ProductBuildDescription> ProductDescriptions;

  /// The root modules at the destination they are naturally built for, in
  /// declaration order.
  SmallVector<BuildIdentity, 8> RootModules;

  BuildPlan(const ResolvedGraph &graph,
            const BuildParameters &destinationParameters,
            const BuildParameters &toolsParameters,
            ModuleAliasResolution aliases);

  bool plan(DiagnosticEngine &diags);

public:
  BuildPlan(const BuildPlan &) = delete;
  BuildPlan &operator=(const BuildPlan &) = delete;

  /// Resolve module aliases and plan every module and product reachable
  /// from the root packages of \p graph.
  ///
  /// \p graph must outlive the returned plan.
  ///
  /// \returns nullptr if any error was diagnosed.
  static std::unique_ptr<BuildPlan>
  create(const ResolvedGraph &graph,
         const BuildParameters &destinationParameters,
         const BuildParameters &toolsParameters, DiagnosticEngine &diags);

  const ResolvedGraph &getGraph() const { return Graph; }
  const ModuleAliasResolution &getAliasResolution() const { return Aliases; }

  const BuildParameters &getBuildParameters(Destination dest) const {
    return dest == Destination::Host ? ToolsParameters
                                     : DestinationParameters;
  }

  const std::map<BuildIdentity, ModuleBuildDescription> &
  getModuleDescriptions() const {
    return ModuleDescriptions;
  }

  const std::map<ProductBuildKey, ProductBuildDescription> &
  getProductDescriptions() const {
    return ProductDescriptions;
  }

  const ModuleBuildDescription *getModuleDescription(ModuleID module,
                                                     Destination dest) const;

  /// Every build of \p module, host first.
  SmallVector<const ModuleBuildDescription *, 2>
  getModuleDescriptions(ModuleID module) const;

  const ProductBuildDescription *getProductDescription(ProductID product,
                                                       Destination dest) const;

  ArrayRef<BuildIdentity> getRootModules() const { return RootModules; }

  /// The destination a module is built for when reached from a consumer
  /// built for \p inherited.
  Destination getModuleDestination(ModuleID module,
                                   Destination inherited) const;

  /// The destination a product is built for when reached from a consumer
  /// built for \p inherited.
  Destination getProductDestination(ProductID product,
                                    Destination inherited) const;

  /// Walk the plan depth-first from every root module.
  ///
  /// \p visit is called once per incoming edge, so a module below two
  /// parents is reported twice; a module's own dependencies are walked
  /// the first time it is reached. Depth starts at 1 for the roots.
  void traverseModules(ModuleVisitor visit) const;

  /// Visit the direct dependencies of \p module in declaration order.
  void traverseDependencies(const ModuleBuildDescription &module,
                            ProductCallback onProduct,
                            ModuleCallback onModule) const;

  /// The transitive dependencies of \p module in depth-first preorder.
  ///
  /// Each product and each module build appears once; a module built for
  /// both destinations appears once per destination.
  std::vector<PlannedDependency>
  recursiveDependencies(const ModuleBuildDescription &module) const;

  void print(raw_ostream &OS) const;
  void dump() const;
};

} // end namespace pkgplan

#endif // PKGPLAN_BUILD_BUILDPLAN_H
