//===--- LLVM.h - Import various common LLVM datatypes ----------*- C++ -*-===//
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
// This file forward declares and imports various common LLVM datatypes that
// pkgplan wants to use unqualified.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BASIC_LLVM_H
#define PKGPLAN_BASIC_LLVM_H

// Do not proliferate #includes here, require clients to #include their
// dependencies.

// Forward declarations.
namespace llvm {
  // Containers.
  class StringRef;
  class Twine;
  template <typename T, unsigned N> class SmallVector;
  template <unsigned N> class SmallString;
  template<typename T> class ArrayRef;
  template<typename Fn> class function_ref;

  // Other common classes.
  class raw_ostream;
} // end namespace llvm

namespace pkgplan {
  // Containers.
  using llvm::ArrayRef;
  using llvm::SmallString;
  using llvm::SmallVector;
  using llvm::StringRef;
  using llvm::Twine;
  using llvm::function_ref;

  // Other common classes.
  using llvm::raw_ostream;
} // end namespace pkgplan

#endif // PKGPLAN_BASIC_LLVM_H
