//===--- DiagnosticEngine.cpp - Diagnostic Display Engine -----------------===//
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
//  This file defines the DiagnosticEngine class, which manages any diagnostics
//  emitted by pkgplan.
//
//===----------------------------------------------------------------------===//

#define DEBUG_TYPE "pkgplan-basic"
#include "pkgplan/Basic/DiagnosticEngine.h"
#include "pkgplan/Basic/DiagnosticConsumer.h"
#include "pkgplan/Basic/StringExtras.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <iterator>

using namespace pkgplan;

namespace {
enum class DiagnosticOptions {
  /// No options.
  none,

  /// After a fatal error subsequent diagnostics are suppressed.
  Fatal,
};
struct StoredDiagnosticInfo {
  DiagnosticKind kind : 2;
  bool isFatal : 1;

  constexpr StoredDiagnosticInfo(DiagnosticKind k, bool fatal)
      : kind(k), isFatal(fatal) {}
  constexpr StoredDiagnosticInfo(DiagnosticKind k, DiagnosticOptions opts)
      : StoredDiagnosticInfo(k, opts == DiagnosticOptions::Fatal) {}
};
} // end anonymous namespace

static const constexpr StoredDiagnosticInfo storedDiagnosticInfos[] = {
#define ERROR(ID, Options, Text, Signature)                                    \
  StoredDiagnosticInfo(DiagnosticKind::Error, DiagnosticOptions::Options),
#define WARNING(ID, Options, Text, Signature)                                  \
  StoredDiagnosticInfo(DiagnosticKind::Warning, DiagnosticOptions::Options),
#define NOTE(ID, Options, Text, Signature)                                     \
  StoredDiagnosticInfo(DiagnosticKind::Note, DiagnosticOptions::Options),
#include "pkgplan/Basic/DiagnosticsPlanning.def"
};

static const char *diagnosticStrings[] = {
#define DIAG(KIND, ID, Options, Text, Signature) Text,
#include "pkgplan/Basic/DiagnosticsPlanning.def"
    "<not a diagnostic>",
};

static const char *diagnosticIDStrings[] = {
#define DIAG(KIND, ID, Options, Text, Signature) #ID,
#include "pkgplan/Basic/DiagnosticsPlanning.def"
    "<not a diagnostic>",
};

static_assert(std::size(storedDiagnosticInfos) + 1 ==
                  std::size(diagnosticStrings),
              "diagnostic tables out of sync");

DiagnosticKind DiagnosticEngine::getDiagnosticKind(DiagID ID) {
  return storedDiagnosticInfos[(unsigned)ID].kind;
}

bool DiagnosticEngine::isFatal(DiagID ID) {
  return storedDiagnosticInfos[(unsigned)ID].isFatal;
}

StringRef DiagnosticEngine::getDiagnosticString(DiagID ID) {
  return diagnosticStrings[(unsigned)ID];
}

StringRef DiagnosticEngine::getDiagnosticIDStringWithoutOptions(DiagID ID) {
  return diagnosticIDStrings[(unsigned)ID];
}

/// Format a single diagnostic argument and write it to the given
/// stream.
static void formatDiagnosticArgument(ArrayRef<DiagnosticArgument> Args,
                                     unsigned ArgIndex,
                                     llvm::raw_ostream &Out) {
  const DiagnosticArgument &Arg = Args[ArgIndex];
  switch (Arg.getKind()) {
  case DiagnosticArgumentKind::String:
    Out << Arg.getAsString();
    break;

  case DiagnosticArgumentKind::StringList:
    printQuotedList(Out, Arg.getAsStringList());
    break;

  case DiagnosticArgumentKind::Unsigned:
    Out << Arg.getAsUnsigned();
    break;
  }
}

void DiagnosticEngine::formatDiagnosticText(
    llvm::raw_ostream &Out, StringRef InText,
    ArrayRef<DiagnosticArgument> Args) {
  while (!InText.empty()) {
    size_t Percent = InText.find('%');
    if (Percent == StringRef::npos) {
      // Write the rest of the string; we're done.
      Out.write(InText.data(), InText.size());
      break;
    }

    // Write the string up to (but not including) the %, then drop that text
    // (including the %).
    Out.write(InText.data(), Percent);
    InText = InText.substr(Percent + 1);

    // '%%' -> '%'.
    if (!InText.empty() && InText[0] == '%') {
      Out.write('%');
      InText = InText.substr(1);
      continue;
    }

    // Find the digit sequence.
    unsigned Length = 0;
    for (size_t N = InText.size(); Length != N; ++Length) {
      if (!llvm::isDigit(InText[Length]))
        break;
    }

    // Parse the digit sequence into an argument index.
    unsigned ArgIndex;
    bool Result = InText.substr(0, Length).getAsInteger(10, ArgIndex);
    assert(!Result && "Unparseable argument index value?");
    (void)Result;
    assert(ArgIndex < Args.size() && "Out-of-range argument index");
    InText = InText.substr(Length);

    // Convert the argument to a string.
    formatDiagnosticArgument(Args, ArgIndex, Out);
  }
}

std::string DiagnosticInfo::getText() const {
  std::string Text;
  llvm::raw_string_ostream OS(Text);
  DiagnosticEngine::formatDiagnosticText(OS, FormatString, FormatArgs);
  return OS.str();
}

static DiagnosticBehavior toDiagnosticBehavior(DiagnosticKind kind,
                                               bool isFatal) {
  switch (kind) {
  case DiagnosticKind::Note:
    return DiagnosticBehavior::Note;
  case DiagnosticKind::Error:
    return isFatal ? DiagnosticBehavior::Fatal : DiagnosticBehavior::Error;
  case DiagnosticKind::Warning:
    return DiagnosticBehavior::Warning;
  }
  llvm_unreachable("Unhandled DiagnosticKind in switch.");
}

static DiagnosticKind toDiagnosticKind(DiagnosticBehavior behavior) {
  switch (behavior) {
  case DiagnosticBehavior::Ignore:
    llvm_unreachable("trying to map an ignored diagnostic");
  case DiagnosticBehavior::Error:
  case DiagnosticBehavior::Fatal:
    return DiagnosticKind::Error;
  case DiagnosticBehavior::Note:
    return DiagnosticKind::Note;
  case DiagnosticBehavior::Warning:
    return DiagnosticKind::Warning;
  }
  llvm_unreachable("Unhandled DiagnosticBehavior in switch.");
}

DiagnosticBehavior DiagnosticState::determineBehavior(DiagID id) const {
  auto diagInfo = storedDiagnosticInfos[(unsigned)id];
  DiagnosticBehavior lvl = toDiagnosticBehavior(diagInfo.kind,
                                                diagInfo.isFatal);

  // Notes relating to ignored diagnostics should also be ignored
  if (previousBehavior == DiagnosticBehavior::Ignore &&
      lvl == DiagnosticBehavior::Note)
    lvl = DiagnosticBehavior::Ignore;

  // Suppress diagnostics when in a fatal state, except for follow-on notes
  if (fatalErrorOccurred)
    if (!showDiagnosticsAfterFatalError && lvl != DiagnosticBehavior::Note)
      lvl = DiagnosticBehavior::Ignore;

  if (lvl == DiagnosticBehavior::Warning) {
    if (warningsAsErrors)
      lvl = DiagnosticBehavior::Error;
    if (suppressWarnings)
      lvl = DiagnosticBehavior::Ignore;
  }
  return lvl;
}

void DiagnosticState::updateFor(DiagnosticBehavior behavior) {
  if (behavior == DiagnosticBehavior::Fatal) {
    fatalErrorOccurred = true;
    anyErrorOccurred = true;
  } else if (behavior == DiagnosticBehavior::Error) {
    anyErrorOccurred = true;
  }

  previousBehavior = behavior;
}

void DiagnosticEngine::removeConsumer(DiagnosticConsumer &Consumer) {
  Consumers.erase(std::remove(Consumers.begin(), Consumers.end(), &Consumer),
                  Consumers.end());
}

unsigned DiagnosticEngine::countDiagnostics(DiagID ID) const {
  return llvm::count_if(EmittedDiagnostics, [ID](const DiagnosticInfo &Info) {
    return Info.ID == ID;
  });
}

bool DiagnosticEngine::finishProcessing() {
  bool hadError = false;
  for (auto *Consumer : Consumers)
    hadError |= Consumer->finishProcessing();
  return hadError;
}

void DiagnosticEngine::emitDiagnostic(const Diagnostic &diagnostic) {
  auto behavior = state.determineBehavior(diagnostic.getID());
  state.updateFor(behavior);
  if (behavior == DiagnosticBehavior::Ignore) {
    LLVM_DEBUG(llvm::dbgs() << "ignoring diagnostic '"
                            << getDiagnosticIDStringWithoutOptions(
                                   diagnostic.getID())
                            << "'\n");
    return;
  }

  EmittedDiagnostics.emplace_back(
      diagnostic.getID(), toDiagnosticKind(behavior),
      behavior == DiagnosticBehavior::Fatal,
      getDiagnosticString(diagnostic.getID()), diagnostic.getArgs());
  const DiagnosticInfo &Info = EmittedDiagnostics.back();

  for (auto &Consumer : Consumers)
    Consumer->handleDiagnostic(Info);
}
