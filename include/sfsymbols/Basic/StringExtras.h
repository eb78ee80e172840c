//===--- StringExtras.h - String Utilities ----------------------*- C++ -*-===//
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
// This file provides utilities for working with words and camelCase names.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_STRINGEXTRAS_H
#define SFSYMBOLS_BASIC_STRINGEXTRAS_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <cassert>
#include <iterator>
#include <string>

namespace sfsymbols {

namespace camel_case {

/// A forward iterator over the words of a camelCase string.
///
/// A word starts at an uppercase letter and runs through the following
/// lowercase letters and digits. A run of uppercase letters forms one
/// acronym word ("URLLoader" is "URL", "Loader"), and "_" is a word of
/// its own.
class WordIterator {
  StringRef String;
  unsigned Position;
  mutable unsigned NextPosition = 0;
  mutable bool NextPositionValid = false;

  void computeNextPosition() const;

public:
  using value_type = StringRef;
  using reference = StringRef;
  using pointer = void;
  using difference_type = int;
  using iterator_category = std::forward_iterator_tag;

  WordIterator(StringRef string, unsigned position)
      : String(string), Position(position) {}

  StringRef operator*() const {
    if (!NextPositionValid)
      computeNextPosition();
    return String.slice(Position, NextPosition);
  }

  WordIterator &operator++() {
    if (!NextPositionValid)
      computeNextPosition();
    Position = NextPosition;
    NextPositionValid = false;
    return *this;
  }

  WordIterator operator++(int) {
    WordIterator tmp(*this);
    ++(*this);
    return tmp;
  }

  friend bool operator==(const WordIterator &x, const WordIterator &y) {
    assert(x.String.data() == y.String.data() &&
           x.String.size() == y.String.size() &&
           "comparing word iterators from different strings");
    return x.Position == y.Position;
  }

  friend bool operator!=(const WordIterator &x, const WordIterator &y) {
    return !(x == y);
  }
};

/// A collection of words in a camelCase string.
class Words {
  StringRef String;

public:
  using iterator = WordIterator;

  explicit Words(StringRef string) : String(string) {}

  bool empty() const { return String.empty(); }

  iterator begin() const { return WordIterator(String, 0); }
  iterator end() const { return WordIterator(String, String.size()); }
};

/// Retrieve the camelCase words in the given string.
inline Words getWords(StringRef string) { return Words(string); }

/// Lowercase every character in the given word.
///
/// \param scratch Scratch buffer used to form the resulting string.
StringRef toLowercaseWord(StringRef string, SmallVectorImpl<char> &scratch);

/// Uppercase the first character of the given word and lowercase the rest.
///
/// \param scratch Scratch buffer used to form the resulting string.
StringRef toCapitalizedWord(StringRef string, SmallVectorImpl<char> &scratch);

} // end namespace camel_case

/// Whether the given character can appear inside a word of a symbol name.
///
/// Bytes outside of the ASCII range are treated as word characters so that
/// UTF-8 sequences are never split.
bool isWordCharacter(char c);

/// Determine whether \p word is a non-empty run of decimal digits.
bool isNumericWord(StringRef word);

/// Segment \p name into words.
///
/// Words are the runs of word characters between separators (dots, dashes,
/// underscores, whitespace and other punctuation); each run is further split
/// at its camelCase boundaries, so "arrow.upLeft" becomes "arrow", "up",
/// "Left" and "URLLoader" becomes "URL", "Loader".
void splitIntoWords(StringRef name, SmallVectorImpl<StringRef> &words);

} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_STRINGEXTRAS_H
