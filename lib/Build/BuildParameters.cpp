//===--- BuildParameters.cpp - Per-destination build settings -------------===//
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

#include "pkgplan/Build/BuildParameters.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"

using namespace pkgplan;

StringRef pkgplan::getDestinationName(Destination destination) {
  switch (destination) {
  case Destination::Host: return "host";
  case Destination::Target: return "target";
  }
  llvm_unreachable("Unhandled Destination in switch.");
}

StringRef pkgplan::getBuildConfigurationName(BuildConfiguration configuration) {
  switch (configuration) {
  case BuildConfiguration::Debug: return "debug";
  case BuildConfiguration::Release: return "release";
  }
  llvm_unreachable("Unhandled BuildConfiguration in switch.");
}

std::optional<BuildConfiguration>
pkgplan::parseBuildConfiguration(StringRef name) {
  return llvm::StringSwitch<std::optional<BuildConfiguration>>(name)
      .Case("debug", BuildConfiguration::Debug)
      .Case("release", BuildConfiguration::Release)
      .Default(std::nullopt);
}

BuildParameters::BuildParameters(Destination destination,
                                 const llvm::Triple &triple,
                                 BuildConfiguration configuration,
                                 StringRef scratchPath)
    : TheDestination(destination), TheTriple(triple),
      Configuration(configuration), ScratchPath(scratchPath.str()) {}

std::string BuildParameters::getDataPath() const {
  SmallString<128> path(ScratchPath);
  llvm::sys::path::append(path, TheTriple.str());
  return std::string(path.str());
}

std::string BuildParameters::getBuildPath() const {
  SmallString<128> path(getDataPath());
  llvm::sys::path::append(path, getBuildConfigurationName(Configuration));
  return std::string(path.str());
}

StringRef BuildParameters::getExecutableExtension() const {
  if (TheTriple.isOSWindows())
    return ".exe";
  if (TheTriple.isOSWASI())
    return ".wasm";
  return "";
}

StringRef BuildParameters::getDynamicLibraryPrefix() const {
  if (TheTriple.isOSWindows())
    return "";
  return "lib";
}

StringRef BuildParameters::getDynamicLibraryExtension() const {
  if (TheTriple.isOSDarwin())
    return ".dylib";
  if (TheTriple.isOSWindows())
    return ".dll";
  if (TheTriple.isOSWASI())
    return ".wasm";
  return ".so";
}

StringRef BuildParameters::getStaticLibraryExtension() const {
  if (TheTriple.isOSWindows())
    return ".lib";
  return ".a";
}

std::string BuildParameters::getBinaryRelativePath(StringRef productName,
                                                   ProductKind kind) const {
  switch (kind) {
  case ProductKind::Executable:
  case ProductKind::Tool:
  case ProductKind::Macro:
    return (productName + getExecutableExtension()).str();
  case ProductKind::StaticLibrary:
    return ("lib" + productName + getStaticLibraryExtension()).str();
  case ProductKind::DynamicLibrary:
    return (getDynamicLibraryPrefix() + productName +
            getDynamicLibraryExtension())
        .str();
  case ProductKind::Test: {
    if (TheTriple.isOSWASI())
      return (productName + ".wasm").str();
    std::string bundle = (productName + ".xctest").str();
    if (!TheTriple.isOSDarwin())
      return bundle;
    SmallString<128> path(bundle);
    llvm::sys::path::append(path, "Contents", "MacOS", productName);
    return std::string(path.str());
  }
  case ProductKind::AutomaticLibrary:
  case ProductKind::Plugin:
    llvm_unreachable("product has no binary of its own");
  }
  llvm_unreachable("Unhandled ProductKind in switch.");
}

std::string BuildParameters::getBinaryPath(StringRef productName,
                                           ProductKind kind) const {
  SmallString<128> path(getBuildPath());
  llvm::sys::path::append(path, getBinaryRelativePath(productName, kind));
  return std::string(path.str());
}
