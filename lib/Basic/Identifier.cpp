//===--- Identifier.cpp - Swift identifiers for symbol names --------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/Identifier.h"
#include "sfsymbols/Basic/StringExtras.h"
#include "clang/Basic/CharInfo.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"

using namespace sfsymbols;

static const llvm::StringSet<> &getReservedWords() {
  static const char *const Words[] = {
#define KEYWORD(kw) #kw,
#include "sfsymbols/Basic/Keywords.def"
  };
  static const llvm::StringSet<> Set = [] {
    llvm::StringSet<> result;
    for (const char *word : Words)
      result.insert(word);
    return result;
  }();
  return Set;
}

bool sfsymbols::isReservedWord(StringRef word) {
  return getReservedWords().count(word) != 0;
}

std::string sfsymbols::escapeIdentifier(StringRef name) {
  if (!isReservedWord(name))
    return name.str();
  return ("`" + name + "`").str();
}

std::string sfsymbols::deriveIdentifier(StringRef rawName) {
  SmallVector<StringRef, 8> words;
  splitIntoWords(rawName, words);
  if (words.empty())
    return std::string();

  llvm::SmallString<64> result;
  llvm::SmallString<16> scratch;
  for (auto indexedWord : llvm::enumerate(words)) {
    StringRef word = indexedWord.value();
    if (isNumericWord(word)) {
      result += '_';
      result += word;
      continue;
    }

    if (indexedWord.index() == 0)
      result += camel_case::toLowercaseWord(word, scratch);
    else
      result += camel_case::toCapitalizedWord(word, scratch);
  }

  // An identifier cannot start with a digit ("4k.tv").
  if (clang::isDigit(result.front()))
    result.insert(result.begin(), '_');

  return escapeIdentifier(result);
}
