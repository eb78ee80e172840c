//===--- DeclarationMutatorTest.cpp ---------------------------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Frontend/DeclarationMutator.h"
#include "sfsymbols/Catalog/StringsFile.h"
#include "sfsymbols/Catalog/SymbolCatalog.h"
#include "sfsymbols/Render/TextRenderer.h"
#include "gtest/gtest.h"
#include <algorithm>
#include <iterator>

using namespace sfsymbols;

static DeclPtr makeDocumentedVar(StringRef identifier, StringRef name) {
  auto var = VarDecl::create(std::nullopt, /*isStatic=*/true, BindingKind::Var,
                             identifier,
                             ExistingType::getNamed("SFSymbolResource"));
  return CommentableDecl::create(
      Comment::getDoc(("The \"" + name + "\" SF Symbol.\n").str()),
      std::move(var));
}

static NameAvailability makeAvailability() {
  NameAvailability availability;
  availability.addSymbol("message.circle", "2019");
  availability.addSymbol("applelogo", "2023");
  availability.addRelease("2019", {"13.0", "11.0", "13.0", "6.0", "1.0"});
  return availability;
}

static StringsTable makeTable(StringRef text) {
  return llvm::cantFail(StringsTable::loadFromBuffer(text));
}

TEST(AvailabilityMutator, AddsEveryPlatformBelowComments) {
  auto availability = makeAvailability();
  AvailabilityMutator mutator(availability);

  DeclPtr D = mutator.mutate(makeDocumentedVar("messageCircle",
                                               "message.circle"),
                             "message.circle");
  ASSERT_TRUE(isa<CommentableDecl>(D.get()));
  EXPECT_TRUE(isa<AttributedDecl>(cast<CommentableDecl>(D.get())->getInner()));
  EXPECT_EQ("/// The \"message.circle\" SF Symbol.\n"
            "///\n"
            "@available(iOS 13.0, macOS 11.0, macCatalyst 13.0, tvOS 13.0, "
            "visionOS 1.0, watchOS 6.0, *)\n"
            "static var messageCircle: SFSymbolResource",
            renderDeclAsString(D.get()));
}

TEST(AvailabilityMutator, UnknownNamesAreUntouched) {
  auto availability = makeAvailability();
  AvailabilityMutator mutator(availability);

  DeclPtr D = makeDocumentedVar("heart", "heart");
  const Decl *original = D.get();
  D = mutator.mutate(std::move(D), "heart");
  EXPECT_EQ(original, D.get());
  EXPECT_FALSE(isa<AttributedDecl>(cast<CommentableDecl>(D.get())->getInner()));

  // Known symbol with an availability key missing from the release table.
  D = mutator.mutate(std::move(D), "applelogo");
  EXPECT_EQ(original, D.get());
}

TEST(DeprecationMutator, NamesTheReplacement) {
  auto aliases = makeTable("\"person.circle.old\" = \"person.circle\";");
  DeprecationMutator mutator(aliases);

  DeclPtr D = mutator.mutate(makeDocumentedVar("personCircleOld",
                                               "person.circle.old"),
                             "person.circle.old");
  std::string rendered = renderDeclAsString(D.get());
  EXPECT_EQ(0u, rendered.find("/// The \"person.circle.old\" SF Symbol."));
  EXPECT_NE(std::string::npos,
            rendered.find(std::string("@available(*, deprecated, message: \"") +
                          DeprecationMutator::Message +
                          "\", renamed: \"person.circle\")\n"
                          "static var personCircleOld"));

  DeclPtr untouched = makeDocumentedVar("personCircle", "person.circle");
  const Decl *original = untouched.get();
  EXPECT_EQ(original,
            mutator.mutate(std::move(untouched), "person.circle").get());
}

TEST(RestrictionMutator, AppendsToDocumentation) {
  auto restrictions = makeTable("\"c.square\" = \"Mine.\";");
  RestrictionMutator mutator(restrictions);

  DeclPtr D = mutator.mutate(makeDocumentedVar("cSquare", "c.square"),
                             "c.square");
  EXPECT_EQ("/// The \"c.square\" SF Symbol.\n"
            "///\n"
            "/// - Important: Mine.\n"
            "static var cSquare: SFSymbolResource",
            renderDeclAsString(D.get()));
}

TEST(RestrictionMutator, WrapsUndocumentedDeclarations) {
  auto restrictions = makeTable("\"c.square\" = \"Mine.\";");
  RestrictionMutator mutator(restrictions);

  DeclPtr D = VarDecl::create(std::nullopt, /*isStatic=*/true,
                              BindingKind::Var, "cSquare",
                              ExistingType::getNamed("SFSymbolResource"));
  D = mutator.mutate(std::move(D), "c.square");
  ASSERT_TRUE(isa<CommentableDecl>(D.get()));
  EXPECT_EQ("/// - Important: Mine.\n"
            "static var cSquare: SFSymbolResource",
            renderDeclAsString(D.get()));
}

TEST(DeclarationMutator, AttributesStackInMutationOrder) {
  auto availability = makeAvailability();
  availability.addSymbol("message.circle.old", "2019");
  auto aliases = makeTable("\"message.circle.old\" = \"message.circle\";");
  DeprecationMutator deprecation(aliases);
  AvailabilityMutator introduced(availability);

  DeclPtr D = makeDocumentedVar("messageCircleOld", "message.circle.old");
  D = deprecation.mutate(std::move(D), "message.circle.old");
  D = introduced.mutate(std::move(D), "message.circle.old");

  std::string rendered = renderDeclAsString(D.get());
  size_t introducedPos = rendered.find("@available(iOS 13.0");
  size_t deprecatedPos = rendered.find("@available(*, deprecated");
  ASSERT_NE(std::string::npos, introducedPos);
  ASSERT_NE(std::string::npos, deprecatedPos);
  EXPECT_LT(introducedPos, deprecatedPos);
}

TEST(DeclarationMutator, CalloutStaysFirstInEveryOrder) {
  auto availability = makeAvailability();
  availability.addSymbol("message.circle.old", "2019");
  auto aliases = makeTable("\"message.circle.old\" = \"message.circle\";");
  auto restrictions = makeTable("\"message.circle.old\" = \"Mine.\";");
  AvailabilityMutator introduced(availability);
  DeprecationMutator deprecation(aliases);
  RestrictionMutator restriction(restrictions);

  const DeclarationMutator *mutators[] = {&introduced, &deprecation,
                                          &restriction};
  unsigned order[] = {0, 1, 2};
  unsigned permutations = 0;
  do {
    DeclPtr D = VarDecl::create(std::nullopt, /*isStatic=*/true,
                                BindingKind::Var, "messageCircleOld",
                                ExistingType::getNamed("SFSymbolResource"));
    for (unsigned index : order)
      D = mutators[index]->mutate(std::move(D), "message.circle.old");
    ++permutations;

    std::string rendered = renderDeclAsString(D.get());
    SCOPED_TRACE(rendered);
    EXPECT_EQ(0u, rendered.find("/// - Important: Mine.\n@available("));
    EXPECT_NE(std::string::npos, rendered.find("\n@available(iOS 13.0"));
    EXPECT_NE(std::string::npos, rendered.find("\n@available(*, deprecated"));
    EXPECT_EQ(1u, llvm::StringRef(rendered).count("/// "));
    EXPECT_TRUE(llvm::StringRef(rendered).endswith(
        "\nstatic var messageCircleOld: SFSymbolResource"));
  } while (std::next_permutation(std::begin(order), std::end(order)));
  EXPECT_EQ(6u, permutations);
}
