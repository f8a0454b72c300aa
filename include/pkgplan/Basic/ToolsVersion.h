//===--- ToolsVersion.h - Package tools-version numbers ---------*- C++ -*-===//
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
// This file defines the ToolsVersion class, the dotted version a package
// declares to select which package-manager features apply to it.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BASIC_TOOLSVERSION_H
#define PKGPLAN_BASIC_TOOLSVERSION_H

#include "pkgplan/Basic/LLVM.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>

namespace pkgplan {

/// A dotted tools-version number, e.g. "5.9" or "5.7.1".
///
/// Missing trailing components compare as zero, so "5.7" == "5.7.0".
class ToolsVersion {
  SmallVector<unsigned, 3> Components;

public:
  /// Create the empty version, which compares newer than every other
  /// version.
  ToolsVersion() = default;

  ToolsVersion(std::initializer_list<unsigned> Values)
      : Components(Values) {}

  /// Parse a version in the form used by the "tools-version" manifest field.
  ///
  /// \returns std::nullopt if \p VersionString is not a dot-separated list
  /// of one to three non-negative integers.
  static std::optional<ToolsVersion> parse(StringRef VersionString);

  /// The first tools-version that resolves product dependencies by
  /// package-qualified identity, which is what lets two packages vend
  /// products with the same name.
  static ToolsVersion minimumForProductAliasing() { return {5, 2}; }

  /// The first tools-version whose modules may be renamed with
  /// module aliases.
  static ToolsVersion minimumForModuleAliasing() { return {5, 7}; }

  /// The tools-version assumed for packages that do not declare one.
  static ToolsVersion current() { return {6, 0}; }

  unsigned getMajor() const { return Components.empty() ? 0 : Components[0]; }
  unsigned getMinor() const {
    return Components.size() < 2 ? 0 : Components[1];
  }

  unsigned operator[](size_t I) const { return Components[I]; }
  size_t size() const { return Components.size(); }
  bool empty() const { return Components.empty(); }

  bool supportsProductAliasing() const {
    return *this >= minimumForProductAliasing();
  }
  bool supportsModuleAliasing() const {
    return *this >= minimumForModuleAliasing();
  }

  std::string getAsString() const;

  friend bool operator>=(const ToolsVersion &lhs, const ToolsVersion &rhs);
  friend bool operator<(const ToolsVersion &lhs, const ToolsVersion &rhs);
  friend bool operator==(const ToolsVersion &lhs, const ToolsVersion &rhs);
  friend bool operator!=(const ToolsVersion &lhs, const ToolsVersion &rhs) {
    return !(lhs == rhs);
  }
};

bool operator>=(const ToolsVersion &lhs, const ToolsVersion &rhs);
bool operator<(const ToolsVersion &lhs, const ToolsVersion &rhs);
bool operator==(const ToolsVersion &lhs, const ToolsVersion &rhs);

raw_ostream &operator<<(raw_ostream &os, const ToolsVersion &version);

} // end namespace pkgplan

#endif // PKGPLAN_BASIC_TOOLSVERSION_H
