//===--- DiagnosticConsumer.cpp - Diagnostic Consumer Impl ----------------===//
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
//  This file implements the DiagnosticConsumer class and the consumers that
//  ship with the Basic library.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pkgplan-basic"
#include "pkgplan/Basic/DiagnosticConsumer.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"
using namespace pkgplan;

DiagnosticConsumer::~DiagnosticConsumer() = default;

void NullDiagnosticConsumer::handleDiagnostic(const DiagnosticInfo &Info) {
  LLVM_DEBUG({
    llvm::dbgs() << "NullDiagnosticConsumer received diagnostic: ";
    DiagnosticEngine::formatDiagnosticText(llvm::dbgs(), Info.FormatString,
                                           Info.FormatArgs);
    llvm::dbgs() << "\n";
  });
}

PrintingDiagnosticConsumer::PrintingDiagnosticConsumer(raw_ostream &stream)
    : Stream(stream) {}

void PrintingDiagnosticConsumer::handleDiagnostic(const DiagnosticInfo &Info) {
  llvm::raw_ostream::Colors Color = llvm::raw_ostream::SAVEDCOLOR;
  StringRef Label;
  switch (Info.Kind) {
  case DiagnosticKind::Error:
    Color = llvm::raw_ostream::RED;
    Label = "error";
    DidErrorOccur = true;
    break;
  case DiagnosticKind::Warning:
    Color = llvm::raw_ostream::MAGENTA;
    Label = "warning";
    break;
  case DiagnosticKind::Note:
    Color = llvm::raw_ostream::BLACK;
    Label = "note";
    break;
  }

  bool UseColors = ForceColors || Stream.has_colors();
  if (UseColors)
    Stream.changeColor(Color, /*Bold=*/true);
  Stream << Label << ": ";
  if (UseColors)
    Stream.resetColor();

  DiagnosticEngine::formatDiagnosticText(Stream, Info.FormatString,
                                         Info.FormatArgs);
  Stream << '\n';
}

bool PrintingDiagnosticConsumer::finishProcessing() {
  Stream.flush();
  return false;
}
