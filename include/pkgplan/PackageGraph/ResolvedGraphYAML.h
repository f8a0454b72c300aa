//===--- ResolvedGraphYAML.h - YAML form of a resolved graph ----*- C++ -*-===//
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
//
// Reading and writing a ResolvedGraph as a YAML document:
//
//   packages:
//     - identity: barPkg
//       location: /barPkg
//       tools-version: "5.9"
//       root: false
//       modules:
//         - name: Logging
//           kind: library
//           sources: [ swift ]
//           dependencies:
//             - module: Utils
//             - product: Logging
//               package: fooPkg
//               aliases: { Logging: FooLogging }
//       products:
//         - name: Logging
//           kind: library
//           modules: [ Logging ]
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPHYAML_H
#define PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPHYAML_H

#include "pkgplan/Basic/LLVM.h"
#include "pkgplan/PackageGraph/ResolvedGraph.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

namespace pkgplan {

/// Parse a graph from the YAML document in \p buffer.
///
/// Fails if the document is malformed or refers to packages, modules or
/// products it does not declare.
llvm::Expected<ResolvedGraph> parseResolvedGraph(llvm::MemoryBufferRef buffer);

/// Read and parse the YAML graph stored at \p path.
llvm::Expected<ResolvedGraph> loadResolvedGraph(StringRef path);

/// Write \p graph in the form parseResolvedGraph reads.
void writeResolvedGraph(raw_ostream &OS, const ResolvedGraph &graph);

} // end namespace pkgplan

#endif // PKGPLAN_PACKAGEGRAPH_RESOLVEDGRAPHYAML_H
