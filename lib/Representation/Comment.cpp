//===--- Comment.cpp - Comments attached to generated code ----------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/Comment.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorHandling.h"

using namespace sfsymbols;

StringRef Comment::getPrefix() const {
  switch (TheKind) {
  case Kind::Inline:
    return "//";
  case Kind::Doc:
    return "///";
  case Kind::Mark:
    return SectionBreak ? "// MARK: -" : "// MARK:";
  }
  llvm_unreachable("bad comment kind");
}

std::optional<StringRef> Comment::getFirstLineOfContent() const {
  StringRef line = StringRef(Text).split('\n').first;
  if (line.empty() || line.startswith("-"))
    return std::nullopt;
  return line;
}

Comment Comment::withAppendedParagraph(StringRef paragraph) const {
  SmallString<128> text(Text);
  if (text.empty()) {
    text = paragraph;
  } else {
    text += text.endswith("\n") ? "\n" : "\n\n";
    text += paragraph;
  }
  return Comment(TheKind, text.str().str(), SectionBreak);
}

std::optional<Comment> Comment::getFunctionComment(
    std::optional<StringRef> abstract,
    ArrayRef<std::pair<StringRef, std::optional<StringRef>>> parameters) {
  if (parameters.empty()) {
    if (!abstract)
      return std::nullopt;
    return getDoc(*abstract);
  }

  std::string text;
  if (abstract) {
    text += abstract->str();
    text += "\n\n";
  }
  text += "- Parameters:";
  for (const auto &parameter : parameters) {
    text += "\n  - ";
    text += parameter.first.str();
    text += ':';
    if (!parameter.second)
      continue;
    Comment description = getDoc(*parameter.second);
    if (auto firstLine = description.getFirstLineOfContent()) {
      text += ' ';
      text += firstLine->str();
    }
  }
  return getDoc(text);
}
