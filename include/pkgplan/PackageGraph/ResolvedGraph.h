//===--- ResolvedGraph.h - Resolved package graph ---------------*- C++ -*-===//
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
// This file defines the immutable graph of packages, products and modules
// that build planning starts from. Entities live in flat tables owned by the
// graph and refer to each other through typed indices.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPH_H
#define PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPH_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/Basic/ToolsVersion.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMapInfo.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pkgplan {

/// A strongly typed index into one of the tables of a ResolvedGraph.
template <typename Tag>
class GraphIndex {
  uint32_t Value;

public:
  constexpr explicit GraphIndex(uint32_t value) : Value(value) {}

  uint32_t getIndex() const { return Value; }

  friend bool operator==(GraphIndex lhs, GraphIndex rhs) {
    return lhs.Value == rhs.Value;
  }
  friend bool operator!=(GraphIndex lhs, GraphIndex rhs) {
    return lhs.Value != rhs.Value;
  }
  friend bool operator<(GraphIndex lhs, GraphIndex rhs) {
    return lhs.Value < rhs.Value;
  }
};

struct PackageIDTag;
struct ModuleIDTag;
struct ProductIDTag;
using PackageID = GraphIndex<PackageIDTag>;
using ModuleID = GraphIndex<ModuleIDTag>;
using ProductID = GraphIndex<ProductIDTag>;

enum class ModuleKind : uint8_t {
  Library,
  Executable,
  Test,
  Macro,
  Plugin,
};

enum class ProductKind : uint8_t {
  /// A library whose linkage is chosen by the client.
  AutomaticLibrary,
  StaticLibrary,
  DynamicLibrary,
  Executable,
  Macro,
  Plugin,
  Test,
  /// An executable that only runs on the build machine.
  Tool,
};

/// The languages a module's sources are written in.
enum class SourceKind : uint8_t {
  Swift = 1 << 0,
  C = 1 << 1,
  CXX = 1 << 2,
  ObjC = 1 << 3,
  Assembly = 1 << 4,
};

/// A set of SourceKind flags.
class SourceKinds {
  uint8_t Bits = 0;

public:
  SourceKinds() = default;
  SourceKinds(SourceKind kind) : Bits(static_cast<uint8_t>(kind)) {}
  SourceKinds(std::initializer_list<SourceKind> kinds) {
    for (auto kind : kinds)
      insert(kind);
  }

  void insert(SourceKind kind) { Bits |= static_cast<uint8_t>(kind); }
  bool contains(SourceKind kind) const {
    return Bits & static_cast<uint8_t>(kind);
  }
  bool empty() const { return Bits == 0; }

  /// Whether every source can have its symbol names rewritten when the
  /// module is renamed. Only Swift sources can.
  bool areAllSubstitutable() const {
    return (Bits & ~static_cast<uint8_t>(SourceKind::Swift)) == 0;
  }

  friend bool operator==(SourceKinds lhs, SourceKinds rhs) {
    return lhs.Bits == rhs.Bits;
  }
};

/// A single `original -> new` rename requested on a product dependency.
struct ModuleAliasRequest {
  std::string OriginalName;
  std::string NewName;

  ModuleAliasRequest(StringRef original, StringRef newName)
      : OriginalName(original.str()), NewName(newName.str()) {}
};

/// One declared dependency of a module: either another module of the same
/// package or a product of some package.
class ModuleDependency {
public:
  enum class Kind : uint8_t {
    Module,
    Product,
  };

private:
  Kind TheKind;
  /// Position of this edge in the owning module's dependency list.
  unsigned Order;
  uint32_t Target;
  SmallVector<ModuleAliasRequest, 1> Aliases;

  ModuleDependency(Kind kind, unsigned order, uint32_t target)
      : TheKind(kind), Order(order), Target(target) {}

public:
  static ModuleDependency forModule(ModuleID module, unsigned order) {
    return ModuleDependency(Kind::Module, order, module.getIndex());
  }

  static ModuleDependency forProduct(ProductID product, unsigned order,
                                     ArrayRef<ModuleAliasRequest> aliases) {
    ModuleDependency result(Kind::Product, order, product.getIndex());
    result.Aliases.append(aliases.begin(), aliases.end());
    return result;
  }

  Kind getKind() const { return TheKind; }
  unsigned getOrder() const { return Order; }
  bool isModule() const { return TheKind == Kind::Module; }
  bool isProduct() const { return TheKind == Kind::Product; }

  ModuleID getModule() const {
    assert(isModule() && "not a module dependency");
    return ModuleID(Target);
  }

  ProductID getProduct() const {
    assert(isProduct() && "not a product dependency");
    return ProductID(Target);
  }

  /// The module aliases requested on this edge, in declaration order.
  /// Always empty for module dependencies.
  ArrayRef<ModuleAliasRequest> getAliases() const { return Aliases; }
};

struct Package {
  PackageID ID;
  /// The normalized (lower-cased) identity.
  std::string Identity;
  /// The identity as written by the author, used in diagnostics.
  std::string DisplayName;
  std::string Location;
  ToolsVersion Tools;
  bool IsRoot = false;
  SmallVector<ModuleID, 4> Modules;
  SmallVector<ProductID, 2> Products;

  Package(PackageID id) : ID(id) {}
};

struct Module {
  ModuleID ID;
  std::string Name;
  PackageID Owner;
  ModuleKind Kind;
  SourceKinds Sources;
  SmallVector<ModuleDependency, 4> Dependencies;

  Module(ModuleID id, PackageID owner) : ID(id), Owner(owner) {}
};

struct Product {
  ProductID ID;
  std::string Name;
  PackageID Owner;
  ProductKind Kind;
  SmallVector<ModuleID, 2> Modules;

  Product(ProductID id, PackageID owner) : ID(id), Owner(owner) {}

  bool isAutomaticLibrary() const {
    return Kind == ProductKind::AutomaticLibrary;
  }
};

/// The resolved dependency graph of a package and all of its dependencies.
///
/// Once built the graph never changes; everything computed from it refers
/// back through PackageID, ModuleID and ProductID.
class ResolvedGraph {
  std::vector<Package> Packages;
  std::vector<Module> Modules;
  std::vector<Product> Products;

  friend class ResolvedGraphBuilder;

public:
  const Package &getPackage(PackageID id) const {
    assert(id.getIndex() < Packages.size() && "package out of range");
    return Packages[id.getIndex()];
  }
  const Module &getModule(ModuleID id) const {
    assert(id.getIndex() < Modules.size() && "module out of range");
    return Modules[id.getIndex()];
  }
  const Product &getProduct(ProductID id) const {
    assert(id.getIndex() < Products.size() && "product out of range");
    return Products[id.getIndex()];
  }

  ArrayRef<Package> getPackages() const { return Packages; }
  ArrayRef<Module> getModules() const { return Modules; }
  ArrayRef<Product> getProducts() const { return Products; }

  const Package &getOwner(const Module &module) const {
    return getPackage(module.Owner);
  }
  const Package &getOwner(const Product &product) const {
    return getPackage(product.Owner);
  }

  /// The root packages, in declaration order.
  SmallVector<PackageID, 2> getRootPackages() const;

  /// Every module of every root package, in declaration order.
  SmallVector<ModuleID, 8> getRootModules() const;

  /// Every product of every root package, in declaration order.
  SmallVector<ProductID, 4> getRootProducts() const;

  /// Look up a package by identity, compared case-insensitively.
  std::optional<PackageID> findPackage(StringRef identity) const;

  std::optional<ModuleID> findModule(PackageID package, StringRef name) const;

  std::optional<ProductID> findProduct(PackageID package,
                                       StringRef name) const;

  /// Find a module by name, searching root packages first.
  std::optional<ModuleID> findModule(StringRef name) const;

  /// Produce a "package:module" description for debugging output.
  std::string getQualifiedName(ModuleID id) const;
  std::string getQualifiedName(ProductID id) const;

  void print(raw_ostream &OS) const;
  void dump() const;
};

/// Incrementally assembles a ResolvedGraph.
///
/// Declaration order of modules, products and dependencies is preserved.
/// Names are expected to be unique within their package; the builder
/// asserts on misuse instead of diagnosing it.
class ResolvedGraphBuilder {
  ResolvedGraph Graph;

public:
  PackageID addPackage(StringRef identity, StringRef location,
                       ToolsVersion tools = ToolsVersion::current(),
                       bool isRoot = false);

  ModuleID addModule(PackageID package, StringRef name,
                     ModuleKind kind = ModuleKind::Library,
                     SourceKinds sources = SourceKind::Swift);

  ProductID addProduct(PackageID package, StringRef name, ProductKind kind,
                       ArrayRef<ModuleID> modules);

  void addModuleDependency(ModuleID from, ModuleID to);

  void addProductDependency(ModuleID from, ProductID to,
                            ArrayRef<ModuleAliasRequest> aliases = {});

  const ResolvedGraph &getGraph() const { return Graph; }

  /// Hand over the finished graph. The builder is empty afterwards.
  ResolvedGraph take();
};

StringRef getModuleKindName(ModuleKind kind);
StringRef getProductKindName(ProductKind kind);

/// Products of these kinds are built for the machine running the build.
bool isHostOnlyProductKind(ProductKind kind);

/// Modules of these kinds are built for the machine running the build.
bool isHostOnlyModuleKind(ModuleKind kind);

} // end namespace pkgplan

namespace llvm {
template <typename Tag> struct DenseMapInfo<pkgplan::GraphIndex<Tag>> {
  using Index = pkgplan::GraphIndex<Tag>;

  static inline Index getEmptyKey() { return Index(~0U); }
  static inline Index getTombstoneKey() { return Index(~0U - 1); }
  static unsigned getHashValue(Index id) {
    return DenseMapInfo<uint32_t>::getHashValue(id.getIndex());
  }
  static bool isEqual(Index lhs, Index rhs) { return lhs == rhs; }
};
} // end namespace llvm

#endif // PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPH_H
