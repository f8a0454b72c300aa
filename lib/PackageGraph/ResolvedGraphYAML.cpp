//===--- ResolvedGraphYAML.cpp - YAML form of a resolved graph ------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2020 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See https://swift.org/LICENSE.txt for license information
// See https://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "pkgplan/PackageGraph/ResolvedGraphYAML.h"
#include "pkgplan/Basic/StringExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include "llvm/Support/YAMLTraits.h"
#include "llvm/Support/raw_ostream.h"
#include <map>

using namespace pkgplan;

//==============================================================================
// MARK: Document model
//==============================================================================

namespace {
struct DependencyDocument {
  std::string Module;
  std::string Product;
  std::string Package;
  std::map<std::string, std::string> Aliases;
};

struct ModuleDocument {
  std::string Name;
  ModuleKind Kind = ModuleKind::Library;
  std::vector<SourceKind> Sources;
  std::vector<DependencyDocument> Dependencies;
};

struct ProductDocument {
  std::string Name;
  ProductKind Kind = ProductKind::AutomaticLibrary;
  std::vector<std::string> Modules;
};

struct PackageDocument {
  std::string Identity;
  std::string Location;
  ToolsVersion Tools = ToolsVersion::current();
  bool IsRoot = false;
  std::vector<ModuleDocument> Modules;
  std::vector<ProductDocument> Products;
};

struct GraphDocument {
  std::vector<PackageDocument> Packages;
};
} // end anonymous namespace

//==============================================================================
// MARK: YAML traits
//==============================================================================

LLVM_YAML_IS_FLOW_SEQUENCE_VECTOR(pkgplan::SourceKind)
LLVM_YAML_IS_SEQUENCE_VECTOR(DependencyDocument)
LLVM_YAML_IS_SEQUENCE_VECTOR(ModuleDocument)
LLVM_YAML_IS_SEQUENCE_VECTOR(ProductDocument)
LLVM_YAML_IS_SEQUENCE_VECTOR(PackageDocument)
LLVM_YAML_IS_STRING_MAP(std::string)

LLVM_YAML_DECLARE_ENUM_TRAITS(pkgplan::ModuleKind)
LLVM_YAML_DECLARE_ENUM_TRAITS(pkgplan::ProductKind)
LLVM_YAML_DECLARE_ENUM_TRAITS(pkgplan::SourceKind)
LLVM_YAML_DECLARE_SCALAR_TRAITS(pkgplan::ToolsVersion,
                                QuotingType::Double)
LLVM_YAML_DECLARE_MAPPING_TRAITS(DependencyDocument)
LLVM_YAML_DECLARE_MAPPING_TRAITS(ModuleDocument)
LLVM_YAML_DECLARE_MAPPING_TRAITS(ProductDocument)
LLVM_YAML_DECLARE_MAPPING_TRAITS(PackageDocument)
LLVM_YAML_DECLARE_MAPPING_TRAITS(GraphDocument)

namespace llvm {
namespace yaml {

void ScalarEnumerationTraits<ModuleKind>::enumeration(IO &io,
                                                      ModuleKind &value) {
  io.enumCase(value, "library", ModuleKind::Library);
  io.enumCase(value, "executable", ModuleKind::Executable);
  io.enumCase(value, "test", ModuleKind::Test);
  io.enumCase(value, "macro", ModuleKind::Macro);
  io.enumCase(value, "plugin", ModuleKind::Plugin);
}

void ScalarEnumerationTraits<ProductKind>::enumeration(IO &io,
                                                       ProductKind &value) {
  io.enumCase(value, "library", ProductKind::AutomaticLibrary);
  io.enumCase(value, "static-library", ProductKind::StaticLibrary);
  io.enumCase(value, "dynamic-library", ProductKind::DynamicLibrary);
  io.enumCase(value, "executable", ProductKind::Executable);
  io.enumCase(value, "macro", ProductKind::Macro);
  io.enumCase(value, "plugin", ProductKind::Plugin);
  io.enumCase(value, "test", ProductKind::Test);
  io.enumCase(value, "tool", ProductKind::Tool);
}

void ScalarEnumerationTraits<SourceKind>::enumeration(IO &io,
                                                      SourceKind &value) {
  io.enumCase(value, "swift", SourceKind::Swift);
  io.enumCase(value, "c", SourceKind::C);
  io.enumCase(value, "cxx", SourceKind::CXX);
  io.enumCase(value, "objc", SourceKind::ObjC);
  io.enumCase(value, "asm", SourceKind::Assembly);
}

void ScalarTraits<ToolsVersion>::output(const ToolsVersion &value, void *,
                                        raw_ostream &out) {
  out << value;
}

StringRef ScalarTraits<ToolsVersion>::input(StringRef scalar, void *,
                                            ToolsVersion &value) {
  auto parsed = ToolsVersion::parse(scalar);
  if (!parsed)
    return "invalid tools-version";
  value = *parsed;
  return StringRef();
}

void MappingTraits<DependencyDocument>::mapping(IO &io,
                                                DependencyDocument &dep) {
  io.mapOptional("module", dep.Module, std::string());
  io.mapOptional("product", dep.Product, std::string());
  io.mapOptional("package", dep.Package, std::string());
  io.mapOptional("aliases", dep.Aliases, std::map<std::string, std::string>());
}

void MappingTraits<ModuleDocument>::mapping(IO &io, ModuleDocument &module) {
  io.mapRequired("name", module.Name);
  io.mapOptional("kind", module.Kind, ModuleKind::Library);
  io.mapOptional("sources", module.Sources);
  io.mapOptional("dependencies", module.Dependencies);
}

void MappingTraits<ProductDocument>::mapping(IO &io,
                                             ProductDocument &product) {
  io.mapRequired("name", product.Name);
  io.mapOptional("kind", product.Kind, ProductKind::AutomaticLibrary);
  io.mapRequired("modules", product.Modules);
}

void MappingTraits<PackageDocument>::mapping(IO &io,
                                             PackageDocument &package) {
  io.mapRequired("identity", package.Identity);
  io.mapOptional("location", package.Location, std::string());
  io.mapOptional("tools-version", package.Tools, ToolsVersion::current());
  io.mapOptional("root", package.IsRoot, false);
  io.mapOptional("modules", package.Modules);
  io.mapOptional("products", package.Products);
}

void MappingTraits<GraphDocument>::mapping(IO &io, GraphDocument &graph) {
  io.mapRequired("packages", graph.Packages);
}

} // namespace yaml
} // namespace llvm

//==============================================================================
// MARK: Building the graph
//==============================================================================

static llvm::Error makeGraphError(const Twine &message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), message);
}

static void collectYAMLDiagnostic(const llvm::SMDiagnostic &diag,
                                  void *context) {
  auto *messages = static_cast<std::string *>(context);
  llvm::raw_string_ostream OS(*messages);
  diag.print(/*ProgName=*/nullptr, OS, /*ShowColors=*/false);
}

static llvm::Expected<ResolvedGraph>
buildGraph(const GraphDocument &document) {
  ResolvedGraphBuilder builder;
  const ResolvedGraph &graph = builder.getGraph();

  // Declare every package, module and product first so that dependencies
  // may refer forward.
  SmallVector<PackageID, 8> packageIDs;
  for (const auto &packageDoc : document.Packages) {
    if (packageDoc.Identity.empty())
      return makeGraphError("package with an empty identity");
    if (graph.findPackage(packageDoc.Identity))
      return makeGraphError("duplicate package '" + packageDoc.Identity + "'");
    auto packageID = builder.addPackage(packageDoc.Identity,
                                        packageDoc.Location, packageDoc.Tools,
                                        packageDoc.IsRoot);
    packageIDs.push_back(packageID);

    for (const auto &moduleDoc : packageDoc.Modules) {
      if (graph.findModule(packageID, moduleDoc.Name))
        return makeGraphError("duplicate module '" + moduleDoc.Name +
                              "' in package '" + packageDoc.Identity + "'");
      SourceKinds sources;
      for (auto kind : moduleDoc.Sources)
        sources.insert(kind);
      if (sources.empty())
        sources.insert(SourceKind::Swift);
      builder.addModule(packageID, moduleDoc.Name, moduleDoc.Kind, sources);
    }

    for (const auto &productDoc : packageDoc.Products) {
      if (graph.findProduct(packageID, productDoc.Name))
        return makeGraphError("duplicate product '" + productDoc.Name +
                              "' in package '" + packageDoc.Identity + "'");
      SmallVector<ModuleID, 2> modules;
      for (const auto &moduleName : productDoc.Modules) {
        auto moduleID = graph.findModule(packageID, moduleName);
        if (!moduleID)
          return makeGraphError("product '" + productDoc.Name +
                                "' refers to unknown module '" + moduleName +
                                "' in package '" + packageDoc.Identity + "'");
        modules.push_back(*moduleID);
      }
      builder.addProduct(packageID, productDoc.Name, productDoc.Kind,
                         modules);
    }
  }

  for (size_t i = 0, e = document.Packages.size(); i != e; ++i) {
    const auto &packageDoc = document.Packages[i];
    auto packageID = packageIDs[i];

    for (const auto &moduleDoc : packageDoc.Modules) {
      auto from = *graph.findModule(packageID, moduleDoc.Name);
      for (const auto &depDoc : moduleDoc.Dependencies) {
        if (depDoc.Module.empty() == depDoc.Product.empty())
          return makeGraphError("dependency of module '" + moduleDoc.Name +
                                "' must name exactly one of 'module' and "
                                "'product'");

        if (!depDoc.Module.empty()) {
          if (!depDoc.Package.empty() || !depDoc.Aliases.empty())
            return makeGraphError("module dependency '" + depDoc.Module +
                                  "' of '" + moduleDoc.Name +
                                  "' cannot name a package or aliases");
          auto to = graph.findModule(packageID, depDoc.Module);
          if (!to)
            return makeGraphError("module '" + moduleDoc.Name +
                                  "' depends on unknown module '" +
                                  depDoc.Module + "'");
          builder.addModuleDependency(from, *to);
          continue;
        }

        auto productPackage = depDoc.Package.empty()
                                  ? std::optional<PackageID>(packageID)
                                  : graph.findPackage(depDoc.Package);
        if (!productPackage)
          return makeGraphError("module '" + moduleDoc.Name +
                                "' depends on unknown package '" +
                                depDoc.Package + "'");
        auto to = graph.findProduct(*productPackage, depDoc.Product);
        if (!to)
          return makeGraphError(
              "module '" + moduleDoc.Name + "' depends on unknown product '" +
              depDoc.Product + "' in package '" +
              graph.getPackage(*productPackage).DisplayName + "'");

        SmallVector<ModuleAliasRequest, 2> aliases;
        for (const auto &alias : depDoc.Aliases)
          aliases.emplace_back(alias.first, alias.second);
        builder.addProductDependency(from, *to, aliases);
      }
    }
  }

  return builder.take();
}

llvm::Expected<ResolvedGraph>
pkgplan::parseResolvedGraph(llvm::MemoryBufferRef buffer) {
  std::string messages;
  GraphDocument document;
  llvm::yaml::Input yamlReader(buffer, /*Ctxt=*/nullptr, collectYAMLDiagnostic,
                               &messages);
  yamlReader >> document;
  if (yamlReader.error())
    return makeGraphError("malformed package graph '" +
                          buffer.getBufferIdentifier() + "': " +
                          StringRef(messages).trim());
  return buildGraph(document);
}

llvm::Expected<ResolvedGraph> pkgplan::loadResolvedGraph(StringRef path) {
  auto bufferOrError = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrError)
    return llvm::errorCodeToError(bufferOrError.getError());
  return parseResolvedGraph((*bufferOrError)->getMemBufferRef());
}

void pkgplan::writeResolvedGraph(raw_ostream &OS, const ResolvedGraph &graph) {
  GraphDocument document;
  for (const auto &package : graph.getPackages()) {
    PackageDocument packageDoc;
    packageDoc.Identity = package.DisplayName;
    packageDoc.Location = package.Location;
    packageDoc.Tools = package.Tools;
    packageDoc.IsRoot = package.IsRoot;

    for (auto moduleID : package.Modules) {
      const auto &module = graph.getModule(moduleID);
      ModuleDocument moduleDoc;
      moduleDoc.Name = module.Name;
      moduleDoc.Kind = module.Kind;
      for (auto kind : {SourceKind::Swift, SourceKind::C, SourceKind::CXX,
                        SourceKind::ObjC, SourceKind::Assembly})
        if (module.Sources.contains(kind))
          moduleDoc.Sources.push_back(kind);

      for (const auto &dep : module.Dependencies) {
        DependencyDocument depDoc;
        switch (dep.getKind()) {
        case ModuleDependency::Kind::Module:
          depDoc.Module = graph.getModule(dep.getModule()).Name;
          break;
        case ModuleDependency::Kind::Product: {
          const auto &product = graph.getProduct(dep.getProduct());
          depDoc.Product = product.Name;
          depDoc.Package = graph.getOwner(product).DisplayName;
          for (const auto &alias : dep.getAliases())
            depDoc.Aliases.emplace(alias.OriginalName, alias.NewName);
          break;
        }
        }
        moduleDoc.Dependencies.push_back(std::move(depDoc));
      }
      packageDoc.Modules.push_back(std::move(moduleDoc));
    }

    for (auto productID : package.Products) {
      const auto &product = graph.getProduct(productID);
      ProductDocument productDoc;
      productDoc.Name = product.Name;
      productDoc.Kind = product.Kind;
      for (auto moduleID : product.Modules)
        productDoc.Modules.push_back(graph.getModule(moduleID).Name);
      packageDoc.Products.push_back(std::move(productDoc));
    }
    document.Packages.push_back(std::move(packageDoc));
  }

  llvm::yaml::Output yamlWriter(OS);
  yamlWriter << document;
}
