//===--- CodeWriter.h - Line-based source text buffer -----------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_RENDER_CODEWRITER_H
#define SFSYMBOLS_RENDER_CODEWRITER_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include <string>
#include <vector>

namespace sfsymbols {

/// Builds up a generated file line by line.
///
/// Every call to \c writeLine starts a new line indented to the current
/// level, unless \c nextLineAppendsToLastLine was called since the previous
/// write; then the text is appended to the last line instead. Call
/// \c rendered at the end to get the full file contents.
class CodeWriter {
  std::vector<std::string> Lines;

  /// The current nesting level.
  unsigned Level = 0;

  /// Whether the next call to writeLine continues the last stored line.
  bool NextWriteAppendsToLastLine = false;

public:
  /// The number of spaces written per nesting level.
  static constexpr unsigned IndentWidth = 4;

  /// Increases the nesting level for the lifetime of the object.
  class IndentRAII {
    CodeWriter &Self;

  public:
    explicit IndentRAII(CodeWriter &self) : Self(self) { Self.push(); }
    ~IndentRAII() { Self.pop(); }

    IndentRAII(const IndentRAII &) = delete;
    IndentRAII &operator=(const IndentRAII &) = delete;
  };

  /// Writes a line of code.
  void writeLine(const Twine &line);

  /// Writes a line without indentation or text.
  void writeEmptyLine();

  /// Make the next call to \c writeLine continue the last stored line.
  /// Safe to call repeatedly; it is reset by \c writeLine.
  void nextLineAppendsToLastLine() { NextWriteAppendsToLastLine = true; }

  /// Increases the nesting level by 1.
  void push() { ++Level; }

  /// Decreases the nesting level by 1.
  void pop();

  unsigned getLevel() const { return Level; }

  /// Executes \p work with one level deeper indentation. The level is
  /// restored on every exit path.
  template <typename Fn>
  auto withNestedLevel(Fn &&work) -> decltype(work()) {
    IndentRAII indentMore(*this);
    return work();
  }

  ArrayRef<std::string> getLines() const { return Lines; }

  /// Concatenates the stored lines into a single string.
  std::string rendered() const;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_RENDER_CODEWRITER_H
