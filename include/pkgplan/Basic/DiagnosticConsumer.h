//===--- DiagnosticConsumer.h - Diagnostic Consumer Interface ---*- C++ -*-===//
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
//  This header declares the DiagnosticConsumer class, which receives callbacks
//  whenever the front end emits a diagnostic and is responsible for
//  presenting or storing that diagnostic (whatever is appropriate).
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BASIC_DIAGNOSTICCONSUMER_H
#define PKGPLAN_BASIC_DIAGNOSTICCONSUMER_H

#include "pkgplan/Basic/DiagnosticEngine.h"
#include "pkgplan/Basic/LLVM.h"
#include <vector>

namespace pkgplan {

/// Abstract interface for classes that present diagnostics to the user.
class DiagnosticConsumer {
public:
  virtual ~DiagnosticConsumer();

  /// Invoked whenever the engine emits a diagnostic.
  ///
  /// \param Info Information describing the diagnostic.
  virtual void handleDiagnostic(const DiagnosticInfo &Info) = 0;

  /// \returns true if an error occurred while finishing-up.
  virtual bool finishProcessing() { return false; }
};

/// DiagnosticConsumer that discards all diagnostics.
class NullDiagnosticConsumer : public DiagnosticConsumer {
public:
  void handleDiagnostic(const DiagnosticInfo &Info) override;
};

/// Diagnostic consumer that renders diagnostics as "<kind>: <text>" lines.
class PrintingDiagnosticConsumer : public DiagnosticConsumer {
  raw_ostream &Stream;
  bool DidErrorOccur = false;
  bool ForceColors = false;

public:
  explicit PrintingDiagnosticConsumer(raw_ostream &stream);

  void handleDiagnostic(const DiagnosticInfo &Info) override;

  bool finishProcessing() override;

  void forceColors() { ForceColors = true; }

  bool didErrorOccur() { return DidErrorOccur; }
};

/// Diagnostic consumer that keeps copies of everything it is handed.
class CollectingDiagnosticConsumer : public DiagnosticConsumer {
  std::vector<DiagnosticInfo> Diagnostics;

public:
  void handleDiagnostic(const DiagnosticInfo &Info) override {
    Diagnostics.push_back(Info);
  }

  ArrayRef<DiagnosticInfo> getDiagnostics() const { return Diagnostics; }
};

} // end namespace pkgplan

#endif // PKGPLAN_BASIC_DIAGNOSTICCONSUMER_H
