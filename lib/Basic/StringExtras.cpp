//===--- StringExtras.cpp - String Utilities ------------------------------===//
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
// This file implements utilities for working with words and camelCase
// names.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/StringExtras.h"
#include "clang/Basic/CharInfo.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <algorithm>

using namespace sfsymbols;
using namespace camel_case;

using llvm::StringRef;

/// Whether the given word is a plural s
static bool isPluralSuffix(StringRef word) {
  return word == "s" || word == "es" || word == "ies";
}

void WordIterator::computeNextPosition() const {
  assert(Position < String.size() && "Already at end of string");

  unsigned i = Position, n = String.size();

  // Treat _ as a word on its own. Don't coalesce.
  if (String[i] == '_') {
    NextPosition = i + 1;
    NextPositionValid = true;
    return;
  }

  // Skip over any uppercase letters at the beginning of the word.
  while (i < n && clang::isUppercase(String[i]))
    ++i;

  // If there was more than one uppercase letter, this is an
  // acronym.
  if (i - Position > 1) {
    // If we hit the end of the string, that's it. Otherwise, this
    // word ends before the last uppercase letter if the next word is alphabetic
    // (URL_Loader) or after the last uppercase letter if it's not (UTF_8).

    // Collect the lowercase letters up to the next word.
    unsigned endOfNext = i;
    while (endOfNext < n && clang::isLowercase(String[endOfNext]))
      ++endOfNext;

    // If the next word is a plural suffix, add it on.
    if (i == n ||
        (isPluralSuffix(String.slice(i, endOfNext)) &&
         String.slice(i-1, endOfNext) != "Is"))
      NextPosition = endOfNext;
    else if (clang::isLowercase(String[i]))
      NextPosition = i-1;
    else
      NextPosition = i;

    NextPositionValid = true;
    return;
  }

  // Skip non-uppercase letters.
  while (i < n && !clang::isUppercase(String[i]) && String[i] != '_')
    ++i;

  NextPosition = i;
  NextPositionValid = true;
}

StringRef camel_case::toLowercaseWord(StringRef string,
                                      SmallVectorImpl<char> &scratch) {
  if (string.empty())
    return string;

  // Already lowercase.
  if (std::none_of(string.begin(), string.end(),
                   [](char c) { return clang::isUppercase(c); }))
    return string;

  scratch.clear();
  for (char c : string)
    scratch.push_back(clang::toLowercase(c));

  return StringRef(scratch.data(), scratch.size());
}

StringRef camel_case::toCapitalizedWord(StringRef string,
                                        SmallVectorImpl<char> &scratch) {
  if (string.empty())
    return string;

  scratch.clear();
  scratch.push_back(clang::toUppercase(string.front()));
  for (char c : string.drop_front())
    scratch.push_back(clang::toLowercase(c));

  return StringRef(scratch.data(), scratch.size());
}

bool sfsymbols::isWordCharacter(char c) {
  return !clang::isASCII(c) || clang::isAlphanumeric(c);
}

bool sfsymbols::isNumericWord(StringRef word) {
  return !word.empty() &&
         std::all_of(word.begin(), word.end(),
                     [](char c) { return clang::isDigit(c); });
}

void sfsymbols::splitIntoWords(StringRef name,
                               SmallVectorImpl<StringRef> &words) {
  while (!name.empty()) {
    // Drop any separators before the next run.
    size_t start = 0;
    while (start < name.size() && !isWordCharacter(name[start]))
      ++start;
    name = name.drop_front(start);
    if (name.empty())
      break;

    size_t end = 0;
    while (end < name.size() && isWordCharacter(name[end]))
      ++end;

    for (StringRef word : camel_case::getWords(name.take_front(end)))
      words.push_back(word);

    name = name.drop_front(end);
  }
}
