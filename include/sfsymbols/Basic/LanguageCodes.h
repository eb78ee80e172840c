//===--- LanguageCodes.h - Localized symbol name suffixes -------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_LANGUAGECODES_H
#define SFSYMBOLS_BASIC_LANGUAGECODES_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"

namespace sfsymbols {

/// Determine whether \p code is a two-letter ISO 639-1 language code.
bool isLanguageCode(StringRef code);

/// Whether the last dot-separated segment of \p symbolName is a language
/// code, as in "character.book.closed.ja".
bool hasLanguageCodeSuffix(StringRef symbolName);

/// Whether \p symbolName names a right-to-left variant ("arrow.left.rtl").
bool hasRightToLeftSuffix(StringRef symbolName);

} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_LANGUAGECODES_H
