//===--- QuotedString.cpp - Printing a string as a quoted string ----------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "llvm/Support/raw_ostream.h"
#include "sfsymbols/Basic/QuotedString.h"
#include <string>

using namespace sfsymbols;

static const char hexdigit[] = {
  '0', '1', '2', '3', '4', '5', '6', '7', '8', '9',
  'A', 'B', 'C', 'D', 'E', 'F'
};

/// Print \p C escaped if it is a control character, using \p escape as the
/// escape delimiter ("\" or "\#").
static bool printEscapedControlCharacter(llvm::raw_ostream &out, char C,
                                         llvm::StringRef escape) {
  switch (C) {
  case '\t': out << escape << 't'; return true;
  case '\n': out << escape << 'n'; return true;
  case '\r': out << escape << 'r'; return true;
  case '\0': out << escape << '0'; return true;
  default:
    auto c = (unsigned char)C;
    // Other ASCII control characters should get escaped.
    if (c < 0x20 || c == 0x7F) {
      out << escape << "u{" << hexdigit[c >> 4] << hexdigit[c & 0xF] << '}';
      return true;
    }
    return false;
  }
}

void sfsymbols::printAsQuotedString(llvm::raw_ostream &out,
                                    llvm::StringRef text) {
  out << '"';
  for (auto C : text) {
    switch (C) {
    case '\\': out << "\\\\"; break;
    case '"': out << "\\\""; break;
    case '\'': out << '\''; break; // no need to escape these
    default:
      if (!printEscapedControlCharacter(out, C, "\\"))
        out << C;
      break;
    }
  }
  out << '"';
}

unsigned sfsymbols::getRawStringDelimiterCount(llvm::StringRef text) {
  // The literal needs one more pound sign than the longest run following a
  // quote, and one more than the longest run following a backslash so that
  // no escape sequence is formed.
  unsigned count = 1;
  for (size_t i = 0, e = text.size(); i != e; ++i) {
    if (text[i] != '"' && text[i] != '\\')
      continue;
    unsigned run = 0;
    while (i + 1 + run < e && text[i + 1 + run] == '#')
      ++run;
    if (run + 1 > count)
      count = run + 1;
  }
  return count;
}

void sfsymbols::printAsStringLiteral(llvm::raw_ostream &out,
                                     llvm::StringRef text) {
  if (text.find_first_of("\"\\") == llvm::StringRef::npos) {
    printAsQuotedString(out, text);
    return;
  }

  std::string delimiter(getRawStringDelimiterCount(text), '#');
  std::string escape = "\\" + delimiter;

  out << delimiter << '"';
  for (auto C : text) {
    if (!printEscapedControlCharacter(out, C, escape))
      out << C;
  }
  out << '"' << delimiter;
}
