//===--- StringExtras.h - String utilities ----------------------*- C++ -*-===//
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

#ifndef PKGPLAN_BASIC_STRINGEXTRAS_H
#define PKGPLAN_BASIC_STRINGEXTRAS_H

#include "pkgplan/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace pkgplan {

/// Determine whether \p name can be used as a module name.
///
/// The first character must be a letter, an underscore, or a non-ASCII
/// character; every following character may additionally be a digit.
bool isValidModuleName(StringRef name);

/// Compute the canonical form of a package identity, which compares
/// case-insensitively.
std::string normalizePackageIdentity(StringRef identity);

/// Print \p names as a comma-separated list of single-quoted names.
void printQuotedList(raw_ostream &OS, ArrayRef<std::string> names);

} // end namespace pkgplan

#endif // PKGPLAN_BASIC_STRINGEXTRAS_H
