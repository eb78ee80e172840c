//===--- PrettyStackTrace.cpp - Generic PrettyStackTraceEntries -----------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//
//
//  This file implements several PrettyStackTraceEntries that probably
//  ought to be in LLVM.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/PrettyStackTrace.h"
#include "sfsymbols/Basic/QuotedString.h"
#include "sfsymbols/Basic/Version.h"
#include "llvm/Support/raw_ostream.h"

using namespace sfsymbols;

void PrettyStackTraceStringAction::print(llvm::raw_ostream &out) const {
  out << "While " << Action << ' ' << QuotedString(TheString) << '\n';
}

void PrettyStackTraceGeneratorVersion::print(llvm::raw_ostream &out) const {
  out << version::getFullVersion() << '\n';
}
