//===--- StringsFileTest.cpp ----------------------------------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Catalog/StringsFile.h"
#include "llvm/Support/MemoryBuffer.h"
#include "gtest/gtest.h"

using namespace sfsymbols;

static StringsTable parse(StringRef text) {
  auto table = StringsTable::loadFromBuffer(text);
  if (!table) {
    ADD_FAILURE() << llvm::toString(table.takeError());
    return StringsTable();
  }
  return std::move(*table);
}

static std::string parseError(StringRef text) {
  auto table = StringsTable::loadFromBuffer(text);
  if (table) {
    ADD_FAILURE() << "expected a parse error";
    return std::string();
  }
  return llvm::toString(table.takeError());
}

TEST(StringsFile, QuotedEntries) {
  auto table = parse("\"person.circle\" = \"person.crop.circle\";\n"
                     "\"c.square\" = \"c.square.fill\";\n");
  EXPECT_EQ(2u, table.size());
  EXPECT_EQ("person.crop.circle", table.lookup("person.circle").value());
  EXPECT_EQ("c.square.fill", table.lookup("c.square").value());
  EXPECT_FALSE(table.lookup("missing").has_value());
  EXPECT_TRUE(table.contains("c.square"));
}

TEST(StringsFile, EmptyInput) {
  EXPECT_TRUE(parse("").empty());
  EXPECT_TRUE(parse("  // nothing here\n/* or here */\n").empty());
  EXPECT_TRUE(parse("{}").empty());
}

TEST(StringsFile, CommentsAndUnquotedStrings) {
  auto table = parse("/* Restrictions\n   by symbol. */\n"
                     "// A line comment.\n"
                     "applelogo = 'This symbol may not be modified.';\n"
                     "path/to-item.1 = value_$:x ;\n");
  EXPECT_EQ("This symbol may not be modified.",
            table.lookup("applelogo").value());
  EXPECT_EQ("value_$:x", table.lookup("path/to-item.1").value());
}

TEST(StringsFile, Braces) {
  auto table = parse("{\n  \"a\" = \"b\";\n  c = d;\n}\n");
  EXPECT_EQ(2u, table.size());
  EXPECT_EQ("b", table.lookup("a").value());
  EXPECT_EQ("d", table.lookup("c").value());
}

TEST(StringsFile, KeyOnlyShorthand) {
  auto table = parse("\"heart\";");
  EXPECT_EQ("heart", table.lookup("heart").value());
}

TEST(StringsFile, DuplicateKeysKeepLastValue) {
  auto table = parse("a = first;\na = second;\n");
  EXPECT_EQ(1u, table.size());
  EXPECT_EQ("second", table.lookup("a").value());
}

TEST(StringsFile, Escapes) {
  auto table = parse("a = \"tab\\tnew\\nline\";\n"
                     "b = \"quote \\\" and \\\\ backslash\";\n"
                     "c = \"octal \\101\";\n"
                     "d = \"\\U00e9t\\u00E9\";\n"
                     "e = \"\\UD83D\\UDE00\";\n");
  EXPECT_EQ("tab\tnew\nline", table.lookup("a").value());
  EXPECT_EQ("quote \" and \\ backslash", table.lookup("b").value());
  EXPECT_EQ("octal A", table.lookup("c").value());
  EXPECT_EQ("\xC3\xA9t\xC3\xA9", table.lookup("d").value());
  EXPECT_EQ("\xF0\x9F\x98\x80", table.lookup("e").value());
}

TEST(StringsFile, SortedKeys) {
  auto table = parse("zebra = 1;\nalpha = 2;\nAlpha = 3;\n");
  auto keys = table.getSortedKeys();
  ASSERT_EQ(3u, keys.size());
  EXPECT_EQ("Alpha", keys[0]);
  EXPECT_EQ("alpha", keys[1]);
  EXPECT_EQ("zebra", keys[2]);
}

TEST(StringsFile, Errors) {
  EXPECT_EQ("<buffer>:1:10: expected ';' after entry for 'a'",
            parseError("\"a\" = \"b\""));
  EXPECT_EQ("<buffer>:2:5: unterminated string",
            parseError("a = b;\na = \"b;"));
  EXPECT_EQ("<buffer>:1:1: unterminated '/*' comment",
            parseError("/* open"));
  EXPECT_EQ("<buffer>:1:5: unexpected character '=', expected string",
            parseError("a = = b;"));
  EXPECT_EQ("<buffer>:1:10: expected '}' at end of dictionary",
            parseError("{ a = b; "));
  EXPECT_EQ("<buffer>:1:12: unexpected text after '}'",
            parseError("{ a = b; } c"));
}

TEST(StringsFile, ErrorsNameTheBuffer) {
  auto table = StringsTable::loadFromBuffer("a = b", "name_aliases.strings");
  ASSERT_FALSE(static_cast<bool>(table));
  EXPECT_EQ("name_aliases.strings:1:6: expected ';' after entry for 'a'",
            llvm::toString(table.takeError()));
}

TEST(StringsFile, JSON) {
  auto table = parse("{\"person.circle\": \"person.crop.circle\", "
                     "\"tray\": \"tray.fill\"}");
  EXPECT_EQ(2u, table.size());
  EXPECT_EQ("tray.fill", table.lookup("tray").value());

  EXPECT_EQ("<buffer>: value for 'a' is not a string",
            parseError("{\"a\": 1}"));
}

TEST(StringsFile, ByteOrderMarks) {
  auto utf8 = parse("\xEF\xBB\xBF" "a = b;");
  EXPECT_EQ("b", utf8.lookup("a").value());

  // "a=b;" in UTF-16LE with a byte order mark.
  static const char utf16[] = "\xFF\xFE" "a\0=\0b\0;\0";
  auto table = parse(StringRef(utf16, sizeof(utf16) - 1));
  EXPECT_EQ("b", table.lookup("a").value());
}

TEST(StringsFile, BinaryPropertyList) {
  EXPECT_EQ("<buffer>: binary property lists are not supported; convert the "
            "file with 'plutil -convert json'",
            parseError("bplist00\x01\x02"));
}

TEST(StringsFile, MemoryBuffer) {
  auto buffer = llvm::MemoryBuffer::getMemBufferCopy("x = y;", "memory");
  auto table = StringsTable::loadFromBuffer(std::move(buffer));
  ASSERT_TRUE(static_cast<bool>(table));
  EXPECT_EQ("y", table->lookup("x").value());
}

TEST(StringsFile, MissingFile) {
  auto table = StringsTable::loadFromPath("/nonexistent/dir/table.strings");
  ASSERT_FALSE(static_cast<bool>(table));
  std::string message = llvm::toString(table.takeError());
  EXPECT_EQ(0u, message.find("/nonexistent/dir/table.strings: "));
}
