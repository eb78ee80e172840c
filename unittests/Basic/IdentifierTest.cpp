//===--- IdentifierTest.cpp -----------------------------------------------===//
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
#include "gtest/gtest.h"

using namespace sfsymbols;

TEST(Identifier, ReservedWords) {
  EXPECT_TRUE(isReservedWord("return"));
  EXPECT_TRUE(isReservedWord("repeat"));
  EXPECT_TRUE(isReservedWord("case"));
  EXPECT_TRUE(isReservedWord("Type"));
  EXPECT_FALSE(isReservedWord("circle"));
  EXPECT_FALSE(isReservedWord("Return"));
  EXPECT_FALSE(isReservedWord(""));
}

TEST(Identifier, Escape) {
  EXPECT_EQ("`return`", escapeIdentifier("return"));
  EXPECT_EQ("`default`", escapeIdentifier("default"));
  EXPECT_EQ("circle", escapeIdentifier("circle"));
}

TEST(Identifier, DeriveDottedNames) {
  EXPECT_EQ("messageCircle", deriveIdentifier("message.circle"));
  EXPECT_EQ("arrowUpLeftCircle", deriveIdentifier("arrow.up.left.circle"));
  EXPECT_EQ("cSquare", deriveIdentifier("c.square"));
  EXPECT_EQ("heartTextSquareFill", deriveIdentifier("heart.text.square.fill"));
}

TEST(Identifier, DeriveDigits) {
  EXPECT_EQ("_4kTv", deriveIdentifier("4k.tv"));
  EXPECT_EQ("squareGrid3x3", deriveIdentifier("square.grid.3x3"));
  EXPECT_EQ("_01Circle", deriveIdentifier("01.circle"));
  EXPECT_EQ("circle_1", deriveIdentifier("circle.1"));
}

TEST(Identifier, DeriveCamelCaseAndSeparators) {
  EXPECT_EQ("arrowUpLeft", deriveIdentifier("arrow.upLeft"));
  EXPECT_EQ("urlLoader", deriveIdentifier("URLLoader"));
  EXPECT_EQ("personCropCircle", deriveIdentifier("person-crop_circle"));
  EXPECT_EQ("aB", deriveIdentifier("..a..b.."));
}

TEST(Identifier, DeriveReservedAndEmpty) {
  EXPECT_EQ("`return`", deriveIdentifier("return"));
  EXPECT_EQ("`repeat`", deriveIdentifier("repeat"));
  EXPECT_EQ("repeatCircle", deriveIdentifier("repeat.circle"));
  EXPECT_EQ("", deriveIdentifier(""));
  EXPECT_EQ("", deriveIdentifier("..."));
  EXPECT_EQ("", deriveIdentifier("_"));
}

TEST(Identifier, DeriveIsDeterministic) {
  EXPECT_EQ(deriveIdentifier("character.book.closed.ja"),
            deriveIdentifier("character.book.closed.ja"));
  EXPECT_EQ("characterBookClosedJa",
            deriveIdentifier("character.book.closed.ja"));
}
