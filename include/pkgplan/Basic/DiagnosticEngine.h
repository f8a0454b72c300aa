//===--- DiagnosticEngine.h - Diagnostic Display Engine ---------*- C++ -*-===//
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
//  This file declares the DiagnosticEngine class, which manages any
//  diagnostics emitted while resolving module aliases and planning a build.
//
//===----------------------------------------------------------------------===//

#ifndef PKGPLAN_BASIC_DIAGNOSTICENGINE_H
#define PKGPLAN_BASIC_DIAGNOSTICENGINE_H

#include "pkgplan/Basic/LLVM.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

namespace pkgplan {
  class DiagnosticConsumer;

  /// Enumeration describing all of possible diagnostics.
  ///
  /// Each of the diagnostics described in DiagnosticsPlanning.def has an
  /// entry in this enumeration type that uniquely identifies it.
  enum class DiagID : uint32_t {
#define DIAG(KIND,ID,Options,Text,Signature) ID,
#include "pkgplan/Basic/DiagnosticsPlanning.def"
  };

  /// Describes the kind of diagnostic.
  enum class DiagnosticKind : uint8_t {
    Error,
    Warning,
    Note
  };

  /// Describes how a diagnostic is handled once it has been emitted.
  ///
  /// The ordering is significant: a more severe behavior compares greater.
  enum class DiagnosticBehavior : uint8_t {
    Ignore,
    Note,
    Warning,
    Error,
    Fatal,
  };

  /// Describes a diagnostic along with its argument types.
  ///
  /// The diagnostics header introduces instances of this type for each
  /// diagnostic, which provide both the set of argument types (used to
  /// check/convert the arguments at each call site) and the diagnostic ID
  /// (for other information about the diagnostic).
  template<typename ...ArgTypes>
  struct Diag {
    /// The diagnostic ID corresponding to this diagnostic.
    DiagID ID;
  };

  namespace detail {
    /// Describes how to pass a diagnostic argument of the given type.
    ///
    /// By default, diagnostic arguments are passed by value, because they
    /// tend to be small. Larger diagnostic arguments
    /// need to specialize this class template to pass by reference.
    template<typename T>
    struct PassArgument {
      typedef T type;
    };

    /// Given a function type `void (Args...)`, produce the matching Diag.
    template<typename Fn> struct DiagWithArguments;

    template<typename ...ArgTypes>
    struct DiagWithArguments<void(ArgTypes...)> {
      typedef Diag<ArgTypes...> type;
    };
  } // end namespace detail

  enum class DiagnosticArgumentKind {
    String,
    StringList,
    Unsigned,
  };

  /// Variant type that holds a single diagnostic argument of a known
  /// type.
  ///
  /// Arguments own their contents, so a retained diagnostic stays valid
  /// after the graph that produced it is gone.
  class DiagnosticArgument {
    DiagnosticArgumentKind Kind;
    std::string StringVal;
    std::vector<std::string> ListVal;
    unsigned UnsignedVal = 0;

  public:
    DiagnosticArgument(StringRef S)
      : Kind(DiagnosticArgumentKind::String), StringVal(S.str()) {}

    DiagnosticArgument(const char *S)
      : DiagnosticArgument(StringRef(S)) {}

    DiagnosticArgument(ArrayRef<std::string> L)
      : Kind(DiagnosticArgumentKind::StringList), ListVal(L.begin(), L.end()) {
    }

    DiagnosticArgument(unsigned I)
      : Kind(DiagnosticArgumentKind::Unsigned), UnsignedVal(I) {}

    DiagnosticArgumentKind getKind() const { return Kind; }

    StringRef getAsString() const {
      assert(Kind == DiagnosticArgumentKind::String);
      return StringVal;
    }

    ArrayRef<std::string> getAsStringList() const {
      assert(Kind == DiagnosticArgumentKind::StringList);
      return ListVal;
    }

    unsigned getAsUnsigned() const {
      assert(Kind == DiagnosticArgumentKind::Unsigned);
      return UnsignedVal;
    }
  };

  /// A diagnostic that has been emitted, in the form handed to consumers.
  struct DiagnosticInfo {
    DiagID ID;
    DiagnosticKind Kind;
    bool IsFatal;

    /// The unformatted text, with %N placeholders for the arguments.
    StringRef FormatString;

    SmallVector<DiagnosticArgument, 4> FormatArgs;

    DiagnosticInfo(DiagID ID, DiagnosticKind Kind, bool IsFatal,
                   StringRef FormatString,
                   ArrayRef<DiagnosticArgument> FormatArgs)
        : ID(ID), Kind(Kind), IsFatal(IsFatal), FormatString(FormatString),
          FormatArgs(FormatArgs.begin(), FormatArgs.end()) {}

    /// Substitute the arguments into the format string.
    std::string getText() const;
  };

  /// Diagnostic - This is a specific instance of a diagnostic along with all
  /// of the DiagnosticArguments that it requires.
  class Diagnostic {
    DiagID ID;
    SmallVector<DiagnosticArgument, 4> Args;

  public:
    template<typename ...ArgTypes>
    Diagnostic(Diag<ArgTypes...> ID,
               typename detail::PassArgument<ArgTypes>::type... VArgs)
      : ID(ID.ID) {
      DiagnosticArgument DiagArgs[] = {
        DiagnosticArgument(0u), std::move(VArgs)...
      };
      Args.append(DiagArgs + 1, DiagArgs + 1 + sizeof...(VArgs));
    }

    DiagID getID() const { return ID; }
    ArrayRef<DiagnosticArgument> getArgs() const { return Args; }
  };

  /// Tracks what has been emitted so far and decides how each new
  /// diagnostic is handled.
  class DiagnosticState {
    /// Whether we should continue to emit diagnostics, even after a
    /// fatal error
    bool showDiagnosticsAfterFatalError = false;

    /// Whether to treat warnings as errors
    bool warningsAsErrors = false;

    /// Whether to skip emitting warnings
    bool suppressWarnings = false;

    /// Whether a fatal error has occurred
    bool fatalErrorOccurred = false;

    /// Whether any error diagnostics have been emitted.
    bool anyErrorOccurred = false;

    /// Track the previous emitted Behavior, useful for notes
    DiagnosticBehavior previousBehavior = DiagnosticBehavior::Ignore;

  public:
    DiagnosticState() = default;

    /// Figure out the Behavior for the given diagnostic, taking current
    /// state such as fatality into account.
    DiagnosticBehavior determineBehavior(DiagID id) const;

    /// Update the state after a diagnostic with the given behavior has
    /// been emitted.
    void updateFor(DiagnosticBehavior behavior);

    bool hadAnyError() const { return anyErrorOccurred; }
    bool hasFatalErrorOccurred() const { return fatalErrorOccurred; }

    void setShowDiagnosticsAfterFatalError(bool val = true) {
      showDiagnosticsAfterFatalError = val;
    }
    bool getShowDiagnosticsAfterFatalError() const {
      return showDiagnosticsAfterFatalError;
    }

    void setSuppressWarnings(bool val) { suppressWarnings = val; }
    bool getSuppressWarnings() const { return suppressWarnings; }

    void setWarningsAsErrors(bool val) { warningsAsErrors = val; }
    bool getWarningsAsErrors() const { return warningsAsErrors; }

    void resetHadAnyError() {
      anyErrorOccurred = false;
      fatalErrorOccurred = false;
    }
  };

  /// Class responsible for formatting diagnostics and presenting them
  /// to the user.
  class DiagnosticEngine {
    /// The diagnostic consumers (if any) that will be responsible for
    /// actually emitting diagnostics.
    SmallVector<DiagnosticConsumer *, 2> Consumers;

    /// Tracks diagnostic behaviors and state
    DiagnosticState state;

    /// Every diagnostic that was not ignored, in emission order.
    std::vector<DiagnosticInfo> EmittedDiagnostics;

  public:
    DiagnosticEngine() = default;
    DiagnosticEngine(const DiagnosticEngine &) = delete;
    DiagnosticEngine &operator=(const DiagnosticEngine &) = delete;

    /// hadAnyError - return true if any *error* diagnostics have been emitted.
    bool hadAnyError() const { return state.hadAnyError(); }

    bool hasFatalErrorOccurred() const {
      return state.hasFatalErrorOccurred();
    }

    void setShowDiagnosticsAfterFatalError(bool val = true) {
      state.setShowDiagnosticsAfterFatalError(val);
    }

    /// Whether to skip emitting warnings
    void setSuppressWarnings(bool val) { state.setSuppressWarnings(val); }
    bool getSuppressWarnings() const { return state.getSuppressWarnings(); }

    /// Whether to treat warnings as errors
    void setWarningsAsErrors(bool val) { state.setWarningsAsErrors(val); }
    bool getWarningsAsErrors() const { return state.getWarningsAsErrors(); }

    void resetHadAnyError() { state.resetHadAnyError(); }

    /// Add an additional DiagnosticConsumer to receive diagnostics.
    void addConsumer(DiagnosticConsumer &Consumer) {
      Consumers.push_back(&Consumer);
    }

    /// Remove a specific DiagnosticConsumer.
    void removeConsumer(DiagnosticConsumer &Consumer);

    /// Return all DiagnosticConsumers.
    ArrayRef<DiagnosticConsumer *> getConsumers() const { return Consumers; }

    /// The diagnostics emitted so far, including those emitted before any
    /// consumer was attached.
    ArrayRef<DiagnosticInfo> getEmittedDiagnostics() const {
      return EmittedDiagnostics;
    }

    /// Count the emitted diagnostics with the given ID.
    unsigned countDiagnostics(DiagID ID) const;

    /// Emit a diagnostic with the given set of diagnostic arguments.
    ///
    /// \param ID The diagnostic to be emitted.
    ///
    /// \param Args The diagnostic arguments, which will be converted to
    /// the types expected by the diagnostic \p ID.
    template<typename ...ArgTypes>
    void diagnose(Diag<ArgTypes...> ID,
                  typename detail::PassArgument<ArgTypes>::type... Args) {
      emitDiagnostic(Diagnostic(ID, std::move(Args)...));
    }

    /// Emit an already-constructed diagnostic.
    void diagnose(const Diagnostic &D) { emitDiagnostic(D); }

    /// Finish processing and return true if any consumer reported an error
    /// of its own.
    bool finishProcessing();

    /// Format the given diagnostic text and place the result in the given
    /// stream.
    static void formatDiagnosticText(raw_ostream &Out, StringRef InText,
                                     ArrayRef<DiagnosticArgument> FormatArgs);

    static DiagnosticKind getDiagnosticKind(DiagID ID);
    static bool isFatal(DiagID ID);
    static StringRef getDiagnosticString(DiagID ID);
    static StringRef getDiagnosticIDStringWithoutOptions(DiagID ID);

  private:
    void emitDiagnostic(const Diagnostic &diagnostic);
  };

} // end namespace pkgplan

#endif // PKGPLAN_BASIC_DIAGNOSTICENGINE_H
