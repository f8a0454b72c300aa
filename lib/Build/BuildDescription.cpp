//===--- BuildDescription.cpp - Module and product build units ------------===//
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

#include "pkgplan/Build/BuildDescription.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace pkgplan;

std::string ModuleBuildDescription::getTempsPath() const {
  SmallString<128> path(Parameters->getBuildPath());
  llvm::sys::path::append(path, BuildName + ".build");
  return std::string(path.str());
}

void ModuleBuildDescription::print(const ResolvedGraph &graph,
                                   raw_ostream &OS) const {
  OS << "module " << graph.getQualifiedName(getModule()) << " ["
     << getDestinationName(getDestination()) << "] as " << BuildName;
  if (FinalName != graph.getModule(getModule()).Name)
    OS << " (alias " << FinalName << ")";
  if (!AliasMap.empty()) {
    OS << " {";
    bool first = true;
    for (const auto &entry : AliasMap) {
      if (!first)
        OS << ", ";
      OS << entry.first << ": " << entry.second;
      first = false;
    }
    OS << "}";
  }
  OS << "\n";
}

void ProductBuildDescription::print(const ResolvedGraph &graph,
                                    raw_ostream &OS) const {
  OS << "product " << graph.getQualifiedName(getProduct()) << " ["
     << getDestinationName(getDestination()) << "] as " << BuildName << " -> "
     << getBinaryPath() << "\n";
  for (const auto &identity : Modules)
    OS << "  module " << graph.getQualifiedName(identity.Module) << " ["
       << getDestinationName(identity.Dest) << "]\n";
}
