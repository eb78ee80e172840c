//===--- CodeWriter.cpp - Line-based source text buffer -------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Render/CodeWriter.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include <cassert>

using namespace sfsymbols;

void CodeWriter::writeLine(const Twine &line) {
  SmallString<128> scratch;
  StringRef text = line.toStringRef(scratch);

  if (NextWriteAppendsToLastLine && !Lines.empty()) {
    Lines.back() += text.str();
  } else {
    std::string newLine(Level * IndentWidth, ' ');
    newLine += text.str();
    Lines.push_back(std::move(newLine));
  }
  NextWriteAppendsToLastLine = false;
}

void CodeWriter::writeEmptyLine() {
  Lines.emplace_back();
  NextWriteAppendsToLastLine = false;
}

void CodeWriter::pop() {
  assert(Level > 0 && "Cannot pop below 0");
  --Level;
}

std::string CodeWriter::rendered() const {
  return llvm::join(Lines, "\n");
}
