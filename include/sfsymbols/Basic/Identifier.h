//===--- Identifier.h - Swift identifiers for symbol names ------*- C++ -*-===//
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
// This file declares the mapping from dotted SF Symbol names, such as
// "arrow.up.left.circle", to the Swift member names used for their accessors.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_IDENTIFIER_H
#define SFSYMBOLS_BASIC_IDENTIFIER_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace sfsymbols {

/// Determine whether \p word is a Swift keyword, either reserved or
/// contextual, that has to be escaped when used as a member name.
bool isReservedWord(StringRef word);

/// Wrap \p name in backticks if it is a reserved word.
std::string escapeIdentifier(StringRef name);

/// Derive the Swift identifier for the symbol named \p rawName.
///
/// The name is split into words at separators and camelCase boundaries. The
/// first word is lowercased and every later word is capitalized. Numeric
/// words are prefixed with an underscore, and the result is escaped with
/// backticks if it is a reserved word. A name without any word characters
/// ("", "...") has no identifier and produces an empty string.
///
/// \code
///   "message.circle"       -> "messageCircle"
///   "arrow.up.left.circle" -> "arrowUpLeftCircle"
///   "4k.tv"                -> "_4kTv"
///   "square.grid.3x3"      -> "squareGrid3x3"
///   "01.circle"            -> "_01Circle"
///   "return"               -> "`return`"
/// \endcode
std::string deriveIdentifier(StringRef rawName);

} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_IDENTIFIER_H
