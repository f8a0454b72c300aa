//===--- ToolsVersion.cpp - Package tools-version numbers -----------------===//
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

#include "pkgplan/Basic/ToolsVersion.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>

using namespace pkgplan;

std::optional<ToolsVersion> ToolsVersion::parse(StringRef VersionString) {
  ToolsVersion Result;
  if (VersionString.empty())
    return std::nullopt;

  SmallVector<StringRef, 3> SplitComponents;
  VersionString.split(SplitComponents, '.', /*MaxSplit=*/-1,
                      /*KeepEmpty=*/true);
  if (SplitComponents.size() > 3)
    return std::nullopt;

  for (StringRef SplitComponent : SplitComponents) {
    unsigned Value;
    // getAsInteger returns true on failure.
    if (SplitComponent.empty() || SplitComponent.getAsInteger(10, Value))
      return std::nullopt;
    Result.Components.push_back(Value);
  }
  return Result;
}

std::string ToolsVersion::getAsString() const {
  std::string buf;
  llvm::raw_string_ostream OS(buf);
  OS << *this;
  return OS.str();
}

raw_ostream &pkgplan::operator<<(raw_ostream &os, const ToolsVersion &version) {
  if (version.empty())
    return os;
  os << version[0];
  for (size_t i = 1, e = version.size(); i != e; ++i)
    os << '.' << version[i];
  return os;
}

bool pkgplan::operator>=(const ToolsVersion &lhs, const ToolsVersion &rhs) {
  // The empty version represents the latest possible version.
  if (lhs.empty())
    return true;

  auto n = std::max(lhs.size(), rhs.size());

  for (size_t i = 0; i < n; ++i) {
    auto lv = i < lhs.size() ? lhs[i] : 0;
    auto rv = i < rhs.size() ? rhs[i] : 0;
    if (lv < rv)
      return false;
    else if (lv > rv)
      return true;
  }
  // Equality
  return true;
}

bool pkgplan::operator<(const ToolsVersion &lhs, const ToolsVersion &rhs) {
  return !(lhs >= rhs);
}

bool pkgplan::operator==(const ToolsVersion &lhs, const ToolsVersion &rhs) {
  auto n = std::max(lhs.size(), rhs.size());
  for (size_t i = 0; i < n; ++i) {
    auto lv = i < lhs.size() ? lhs[i] : 0;
    auto rv = i < rhs.size() ? rhs[i] : 0;
    if (lv != rv)
      return false;
  }
  return true;
}
