//===--- PrettyStackTrace.h - Generic stack-trace prettifiers ---*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_PRETTYSTACKTRACE_H
#define SFSYMBOLS_BASIC_PRETTYSTACKTRACE_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/PrettyStackTrace.h"

namespace sfsymbols {

/// A PrettyStackTraceEntry for performing an action involving a StringRef.
///
/// The message is:
///   While <action> "<string>"\n
class PrettyStackTraceStringAction : public llvm::PrettyStackTraceEntry {
  const char *Action;
  const StringRef TheString;
public:
  PrettyStackTraceStringAction(const char *action, StringRef string)
    : Action(action), TheString(string) {}
  void print(llvm::raw_ostream &OS) const override;
};

/// A PrettyStackTraceEntry to print the version of the generator.
class PrettyStackTraceGeneratorVersion : public llvm::PrettyStackTraceEntry {
public:
  void print(llvm::raw_ostream &OS) const override;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_PRETTYSTACKTRACE_H
