//===--- SymbolCatalogTest.cpp --------------------------------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Catalog/SymbolCatalog.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace sfsymbols;

static const char AvailabilityJSON[] = R"({
  "symbols": {
    "message.circle": "2019",
    "c.square": "2020",
    "applelogo": "2023"
  },
  "year_to_release": {
    "2019": {"iOS": "13.0", "macOS": "11.0", "tvOS": "13.0",
             "watchOS": "6.0", "visionOS": "1.0"},
    "2020": {"iOS": "14.0", "macOS": "11.0", "tvOS": "14.0",
             "watchOS": "7.0", "visionOS": "1.0"}
  }
})";

static std::string loadError(StringRef json) {
  auto availability = NameAvailability::loadFromBuffer(json);
  if (availability) {
    ADD_FAILURE() << "expected a decoding error";
    return std::string();
  }
  return llvm::toString(availability.takeError());
}

TEST(NameAvailability, Decode) {
  auto availability = NameAvailability::loadFromBuffer(AvailabilityJSON);
  ASSERT_TRUE(static_cast<bool>(availability))
      << llvm::toString(availability.takeError());

  EXPECT_EQ(3u, availability->getNumSymbols());
  EXPECT_TRUE(availability->hasSymbol("c.square"));
  EXPECT_EQ("2019", availability->getAvailabilityKey("message.circle").value());

  auto names = availability->getSortedSymbolNames();
  ASSERT_EQ(3u, names.size());
  EXPECT_EQ("applelogo", names[0]);
  EXPECT_EQ("c.square", names[1]);
  EXPECT_EQ("message.circle", names[2]);

  auto *release = availability->lookupRelease("2020");
  ASSERT_NE(nullptr, release);
  EXPECT_EQ("14.0", release->iOS);
  EXPECT_EQ("7.0", release->watchOS);
  EXPECT_EQ(nullptr, availability->lookupRelease("1999"));
}

TEST(NameAvailability, ReleaseVersions) {
  auto availability = NameAvailability::loadFromBuffer(AvailabilityJSON);
  ASSERT_TRUE(static_cast<bool>(availability));

  auto versions = availability->getReleaseVersions("message.circle");
  ASSERT_TRUE(static_cast<bool>(versions));
  EXPECT_EQ("13.0", versions->getVersion(PlatformKind::iOS));
  EXPECT_EQ("13.0", versions->getVersion(PlatformKind::macCatalyst));
  EXPECT_EQ("11.0", versions->getVersion(PlatformKind::macOS));
  EXPECT_EQ("13.0", versions->getVersion(PlatformKind::tvOS));
  EXPECT_EQ("1.0", versions->getVersion(PlatformKind::visionOS));
  EXPECT_EQ("6.0", versions->getVersion(PlatformKind::watchOS));
  EXPECT_TRUE(versions->getVersion(PlatformKind::none).empty());

  auto unknownKey = availability->getReleaseVersions("applelogo");
  ASSERT_FALSE(static_cast<bool>(unknownKey));
  EXPECT_EQ("symbol 'applelogo' refers to unknown availability key '2023'",
            llvm::toString(unknownKey.takeError()));

  auto unknownSymbol = availability->getReleaseVersions("nope");
  ASSERT_FALSE(static_cast<bool>(unknownSymbol));
  EXPECT_EQ("symbol 'nope' is not in the catalog",
            llvm::toString(unknownSymbol.takeError()));
}

TEST(NameAvailability, DecodeErrors) {
  EXPECT_EQ("<buffer>: top level value is not an object", loadError("[]"));
  EXPECT_EQ("<buffer>: missing 'symbols' object",
            loadError(R"({"year_to_release": {}})"));
  EXPECT_EQ("<buffer>: missing 'year_to_release' object",
            loadError(R"({"symbols": {}})"));
  EXPECT_EQ("<buffer>: availability key of symbol 'a' is not a string",
            loadError(R"({"symbols": {"a": 2019}, "year_to_release": {}})"));
  EXPECT_EQ("<buffer>: release '2019' has no visionOS version",
            loadError(R"({"symbols": {}, "year_to_release": {"2019": {
                "iOS": "13.0", "macOS": "10.15", "tvOS": "13.0",
                "watchOS": "6.0"}}})"));
  EXPECT_EQ("<buffer>: release '2019' is not an object",
            loadError(R"({"symbols": {}, "year_to_release": {"2019": 1}})"));
  EXPECT_NE(std::string::npos, loadError("{").find("<buffer>: "));
}

namespace {

/// A resource directory written to a temporary location.
class SymbolCatalogDirectoryTest : public ::testing::Test {
protected:
  SmallString<128> Directory;

  void SetUp() override {
    std::error_code EC =
        llvm::sys::fs::createUniqueDirectory("sfsymbols-catalog", Directory);
    ASSERT_FALSE(EC) << EC.message();
  }

  void TearDown() override {
    std::error_code EC = llvm::sys::fs::remove_directories(Directory);
    EXPECT_FALSE(EC) << EC.message();
  }

  void writeFile(StringRef name, StringRef contents) {
    SmallString<128> path(Directory);
    llvm::sys::path::append(path, name);
    std::error_code EC;
    llvm::raw_fd_ostream OS(path, EC);
    ASSERT_FALSE(EC) << EC.message();
    OS << contents;
  }

  void writeCatalog() {
    writeFile("name_availability.json", AvailabilityJSON);
    writeFile("name_aliases.strings",
              "\"message.circle.old\" = \"message.circle\";\n");
    writeFile("nofill_to_fill.strings", "\"c.square\" = \"c.square.fill\";\n");
    writeFile("semantic_to_descriptive_name.strings",
              "\"chat.bubble\" = \"message.circle\";\n");
    writeFile("symbol_restrictions.strings",
              "\"c.square\" = \"This symbol may not be modified.\";\n");
  }
};

} // end anonymous namespace

TEST_F(SymbolCatalogDirectoryTest, LoadsEveryTable) {
  writeCatalog();
  auto catalog = SymbolCatalog::loadFromDirectory(Directory);
  ASSERT_TRUE(static_cast<bool>(catalog))
      << llvm::toString(catalog.takeError());

  EXPECT_EQ(3u, catalog->getAvailability().getNumSymbols());
  EXPECT_EQ("message.circle",
            catalog->getNameAliases().lookup("message.circle.old").value());
  EXPECT_EQ("c.square.fill",
            catalog->getNoFillToFill().lookup("c.square").value());
  EXPECT_EQ("message.circle",
            catalog->getSemanticToDescriptive().lookup("chat.bubble").value());
  EXPECT_EQ("This symbol may not be modified.",
            catalog->getSymbolRestrictions().lookup("c.square").value());
}

TEST_F(SymbolCatalogDirectoryTest, MissingTable) {
  writeCatalog();
  SmallString<128> path(Directory);
  llvm::sys::path::append(path, "nofill_to_fill.strings");
  ASSERT_FALSE(llvm::sys::fs::remove(path));

  auto catalog = SymbolCatalog::loadFromDirectory(Directory);
  ASSERT_FALSE(static_cast<bool>(catalog));
  std::string message = llvm::toString(catalog.takeError());
  EXPECT_EQ(0u, message.find(path.str().str() + ": "));
}

TEST_F(SymbolCatalogDirectoryTest, MalformedTable) {
  writeCatalog();
  writeFile("symbol_restrictions.strings", "\"c.square\" = \"unterminated");

  auto catalog = SymbolCatalog::loadFromDirectory(Directory);
  ASSERT_FALSE(static_cast<bool>(catalog));
  std::string message = llvm::toString(catalog.takeError());
  EXPECT_NE(std::string::npos, message.find("symbol_restrictions.strings:1:14"))
      << message;
  EXPECT_NE(std::string::npos, message.find("unterminated string"));
}
