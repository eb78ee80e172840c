//===--- QuotedString.h - Print a string in double-quotes -------*- C++ -*-===//
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
/// \file Declares QuotedString, a convenient type for printing a
/// string as a string literal.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_QUOTEDSTRING_H
#define SFSYMBOLS_BASIC_QUOTEDSTRING_H

#include "llvm/ADT/StringRef.h"

namespace llvm {
  class raw_ostream;
}

namespace sfsymbols {
  /// Print the given string as if it were a quoted string.
  void printAsQuotedString(llvm::raw_ostream &out, llvm::StringRef text);

  /// Print the given string as a Swift string literal.
  ///
  /// Text containing a double quote or a backslash is printed as a raw
  /// string literal (#"..."#) with enough pound signs that the text cannot
  /// terminate it early. Anything else uses the plain quoted form.
  void printAsStringLiteral(llvm::raw_ostream &out, llvm::StringRef text);

  /// The number of pound signs a raw string literal needs to hold \p text.
  unsigned getRawStringDelimiterCount(llvm::StringRef text);

  /// A class designed to make it easy to write a string to a stream
  /// as a quoted string.
  class QuotedString {
    llvm::StringRef Text;
  public:
    explicit QuotedString(llvm::StringRef text) : Text(text) {}

    friend llvm::raw_ostream &operator<<(llvm::raw_ostream &out,
                                         QuotedString string) {
      printAsQuotedString(out, string.Text);
      return out;
    }
  };

  /// A class that writes a string to a stream as a Swift string literal.
  class SwiftStringLiteral {
    llvm::StringRef Text;
  public:
    explicit SwiftStringLiteral(llvm::StringRef text) : Text(text) {}

    friend llvm::raw_ostream &operator<<(llvm::raw_ostream &out,
                                         SwiftStringLiteral string) {
      printAsStringLiteral(out, string.Text);
      return out;
    }
  };
} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_QUOTEDSTRING_H
