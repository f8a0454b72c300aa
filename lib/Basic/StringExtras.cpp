//===--- StringExtras.cpp - String Utilities ------------------------------===//
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

#include "pkgplan/Basic/StringExtras.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

using namespace pkgplan;

static bool isIdentifierHead(unsigned char c) {
  return llvm::isAlpha(c) || c == '_' || c >= 0x80;
}

static bool isIdentifierBody(unsigned char c) {
  return isIdentifierHead(c) || llvm::isDigit(c);
}

bool pkgplan::isValidModuleName(StringRef name) {
  if (name.empty() || !isIdentifierHead(name.front()))
    return false;
  return llvm::all_of(name.drop_front(), [](char c) {
    return isIdentifierBody(static_cast<unsigned char>(c));
  });
}

std::string pkgplan::normalizePackageIdentity(StringRef identity) {
  return identity.trim().lower();
}

void pkgplan::printQuotedList(raw_ostream &OS, ArrayRef<std::string> names) {
  bool first = true;
  for (const auto &name : names) {
    if (!first)
      OS << ", ";
    OS << '\'' << name << '\'';
    first = false;
  }
}
