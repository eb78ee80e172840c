//===--- QuotedStringTest.cpp ---------------------------------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/QuotedString.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace sfsymbols;

static std::string literal(llvm::StringRef text) {
  std::string result;
  llvm::raw_string_ostream OS(result);
  OS << SwiftStringLiteral(text);
  return OS.str();
}

static std::string quoted(llvm::StringRef text) {
  std::string result;
  llvm::raw_string_ostream OS(result);
  OS << QuotedString(text);
  return OS.str();
}

TEST(QuotedString, Plain) {
  EXPECT_EQ("\"message.circle\"", quoted("message.circle"));
  EXPECT_EQ("\"a\\\\b\"", quoted("a\\b"));
  EXPECT_EQ("\"say \\\"hi\\\"\"", quoted("say \"hi\""));
  EXPECT_EQ("\"tab\\tline\\n\"", quoted("tab\tline\n"));
  EXPECT_EQ("\"\\u{01}\"", quoted("\x01"));
}

TEST(QuotedString, LiteralWithoutSpecialCharacters) {
  EXPECT_EQ("\"message.circle\"", literal("message.circle"));
  EXPECT_EQ("\"it's\"", literal("it's"));
  EXPECT_EQ("\"\"", literal(""));
}

TEST(QuotedString, RawLiteral) {
  EXPECT_EQ("#\"a\"b\"#", literal("a\"b"));
  EXPECT_EQ("#\"C:\\dir\"#", literal("C:\\dir"));
  EXPECT_EQ("##\"a\"#b\"##", literal("a\"#b"));
  EXPECT_EQ("#\"a\"b\\#n\"#", literal("a\"b\n"));
}

TEST(QuotedString, RawDelimiterCount) {
  EXPECT_EQ(1u, getRawStringDelimiterCount("plain"));
  EXPECT_EQ(1u, getRawStringDelimiterCount("\"quoted\""));
  EXPECT_EQ(2u, getRawStringDelimiterCount("\"#"));
  EXPECT_EQ(3u, getRawStringDelimiterCount("\\##"));
}
