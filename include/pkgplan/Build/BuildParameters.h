//===--- BuildParameters.h - Per-destination build settings -----*- C++ -*-===//
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

#ifndef PKGPLAN_BUILD_BUILDPARAMETERS_H
#define PKGPLAN_BUILD_BUILDPARAMETERS_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Triple.h"
#include <cstdint>
#include <optional>
#include <string>

namespace pkgplan {

/// Which machine a build artifact is produced for.
enum class Destination : uint8_t {
  /// The machine running the build: macros, plugins and build tools.
  Host,
  /// The platform the final products ship on.
  Target,
};

StringRef getDestinationName(Destination destination);

enum class BuildConfiguration : uint8_t {
  Debug,
  Release,
};

StringRef getBuildConfigurationName(BuildConfiguration configuration);

/// Parse "debug" or "release".
std::optional<BuildConfiguration> parseBuildConfiguration(StringRef name);

/// Settings shared by every artifact built for one destination.
class BuildParameters {
  Destination TheDestination;
  llvm::Triple TheTriple;
  BuildConfiguration Configuration;
  std::string ScratchPath;

public:
  BuildParameters(Destination destination, const llvm::Triple &triple,
                  BuildConfiguration configuration, StringRef scratchPath);

  Destination getDestination() const { return TheDestination; }
  const llvm::Triple &getTriple() const { return TheTriple; }
  BuildConfiguration getConfiguration() const { return Configuration; }
  StringRef getScratchPath() const { return ScratchPath; }

  /// The directory holding everything built for this triple:
  /// `<scratch>/<triple>`.
  std::string getDataPath() const;

  /// `<scratch>/<triple>/<configuration>`.
  std::string getBuildPath() const;

  StringRef getExecutableExtension() const;
  StringRef getDynamicLibraryPrefix() const;
  StringRef getDynamicLibraryExtension() const;
  StringRef getStaticLibraryExtension() const;

  /// The path of a product's binary relative to the build path.
  ///
  /// Automatic libraries and plugins produce no binary of their own and
  /// must not be passed here.
  std::string getBinaryRelativePath(StringRef productName,
                                    ProductKind kind) const;

  std::string getBinaryPath(StringRef productName, ProductKind kind) const;
};

} // end namespace pkgplan

#endif // PKGPLAN_BUILD_BUILDPARAMETERS_H
