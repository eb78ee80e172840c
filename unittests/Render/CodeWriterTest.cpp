//===--- CodeWriterTest.cpp -----------------------------------------------===//
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
#include "gtest/gtest.h"
#include <stdexcept>

using namespace sfsymbols;

TEST(CodeWriter, Indentation) {
  CodeWriter writer;
  writer.writeLine("struct S {");
  writer.push();
  writer.writeLine("let x: Int");
  writer.pop();
  writer.writeLine("}");
  EXPECT_EQ("struct S {\n    let x: Int\n}", writer.rendered());
  EXPECT_EQ(0u, writer.getLevel());
}

TEST(CodeWriter, AppendToLastLine) {
  CodeWriter writer;
  writer.writeLine("static ");
  writer.nextLineAppendsToLastLine();
  writer.nextLineAppendsToLastLine();
  writer.writeLine("var x");
  writer.writeLine("next");
  ASSERT_EQ(2u, writer.getLines().size());
  EXPECT_EQ("static var x", writer.getLines()[0]);
  EXPECT_EQ("next", writer.getLines()[1]);
}

TEST(CodeWriter, AppendWithoutLines) {
  CodeWriter writer;
  writer.nextLineAppendsToLastLine();
  writer.writeLine("first");
  ASSERT_EQ(1u, writer.getLines().size());
  EXPECT_EQ("first", writer.getLines()[0]);
}

TEST(CodeWriter, AppendIgnoresIndentation) {
  CodeWriter writer;
  writer.writeLine("a");
  writer.push();
  writer.nextLineAppendsToLastLine();
  writer.writeLine("b");
  writer.writeLine("c");
  writer.pop();
  EXPECT_EQ("ab\n    c", writer.rendered());
}

TEST(CodeWriter, EmptyLinesKeepIndentation) {
  CodeWriter writer;
  writer.push();
  writer.writeLine("");
  writer.pop();
  EXPECT_EQ("    ", writer.rendered());
}

TEST(CodeWriter, EmptyLineIgnoresIndentation) {
  CodeWriter writer;
  writer.writeLine("a");
  writer.push();
  writer.writeEmptyLine();
  writer.writeLine("b");
  writer.nextLineAppendsToLastLine();
  writer.writeEmptyLine();
  writer.writeLine("c");
  writer.pop();
  EXPECT_EQ("a\n\n    b\n\n    c", writer.rendered());
}

TEST(CodeWriter, NestedLevel) {
  CodeWriter writer;
  int result = writer.withNestedLevel([&] {
    writer.writeLine("inside");
    EXPECT_EQ(1u, writer.getLevel());
    return 42;
  });
  EXPECT_EQ(42, result);
  EXPECT_EQ(0u, writer.getLevel());
  EXPECT_EQ("    inside", writer.rendered());
}

TEST(CodeWriter, NestedLevelRestoredOnThrow) {
  CodeWriter writer;
  auto work = [&] {
    writer.push();
    CodeWriter::IndentRAII inner(writer);
    throw std::runtime_error("failed");
  };
  EXPECT_THROW(writer.withNestedLevel(work), std::runtime_error);
  // The manual push is not undone; both RAII levels are.
  EXPECT_EQ(1u, writer.getLevel());
}

TEST(CodeWriter, IndentRAII) {
  CodeWriter writer;
  {
    CodeWriter::IndentRAII indentMore(writer);
    CodeWriter::IndentRAII indentEvenMore(writer);
    writer.writeLine("deep");
  }
  writer.writeLine("top");
  EXPECT_EQ("        deep\ntop", writer.rendered());
}
