//===--- Comment.h - Comments attached to generated code --------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_COMMENT_H
#define SFSYMBOLS_REPRESENTATION_COMMENT_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>
#include <utility>

namespace sfsymbols {

/// A comment emitted in front of a declaration, expression or file.
///
/// The text may span several lines; every line receives the comment prefix
/// when rendered.
class Comment {
public:
  enum class Kind : uint8_t {
    /// A regular "//" comment.
    Inline,
    /// A "///" documentation comment.
    Doc,
    /// A "// MARK:" comment, optionally with a section break
    /// ("// MARK: -").
    Mark,
  };

private:
  Kind TheKind;
  bool SectionBreak = false;
  std::string Text;

  Comment(Kind kind, std::string text, bool sectionBreak)
      : TheKind(kind), SectionBreak(sectionBreak), Text(std::move(text)) {}

public:
  static Comment getInline(StringRef text) {
    return Comment(Kind::Inline, text.str(), false);
  }
  static Comment getDoc(StringRef text) {
    return Comment(Kind::Doc, text.str(), false);
  }
  static Comment getMark(StringRef text, bool sectionBreak) {
    return Comment(Kind::Mark, text.str(), sectionBreak);
  }

  Kind getKind() const { return TheKind; }
  bool isDoc() const { return TheKind == Kind::Doc; }
  bool isSectionBreak() const { return SectionBreak; }

  /// The text of the comment, without any prefix.
  StringRef getText() const { return Text; }

  /// The prefix written in front of every line ("//", "///", ...).
  StringRef getPrefix() const;

  /// Returns the first line of the text, unless it is empty or starts with a
  /// dash. Lines starting with a dash are appended remarks ("- Important:")
  /// that do not describe the declaration.
  std::optional<StringRef> getFirstLineOfContent() const;

  /// Returns a copy of this comment with \p paragraph appended after a
  /// blank line. A text that already ends in a blank line receives the
  /// paragraph directly.
  Comment withAppendedParagraph(StringRef paragraph) const;

  /// Build the documentation comment of a function: the abstract followed
  /// by a "- Parameters:" list naming each parameter with the first line of
  /// its description.
  static std::optional<Comment> getFunctionComment(
      std::optional<StringRef> abstract,
      ArrayRef<std::pair<StringRef, std::optional<StringRef>>> parameters);
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_COMMENT_H
