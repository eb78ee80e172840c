//===--- SymbolCatalog.cpp - The SF Symbols resource catalog --------------===//
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
#include "sfsymbols/Basic/PrettyStackTrace.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include <algorithm>

using namespace sfsymbols;

StringRef ReleaseVersions::getVersion(PlatformKind platform) const {
  switch (platform) {
  case PlatformKind::iOS:
  case PlatformKind::macCatalyst:
    return iOS;
  case PlatformKind::macOS:
    return macOS;
  case PlatformKind::tvOS:
    return tvOS;
  case PlatformKind::visionOS:
    return visionOS;
  case PlatformKind::watchOS:
    return watchOS;
  case PlatformKind::none:
    return StringRef();
  }
  llvm_unreachable("bad PlatformKind");
}

static llvm::Error makeCatalogError(StringRef bufferName,
                                    const Twine &message) {
  return llvm::make_error<llvm::StringError>(bufferName + ": " + message,
                                             llvm::inconvertibleErrorCode());
}

llvm::Expected<NameAvailability>
NameAvailability::loadFromPath(StringRef path) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> bufferOrErr =
      llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return makeCatalogError(path, bufferOrErr.getError().message());

  PrettyStackTraceStringAction trace("decoding availability table", path);
  return loadFromBuffer((*bufferOrErr)->getBuffer(), path);
}

llvm::Expected<NameAvailability>
NameAvailability::loadFromBuffer(StringRef data, StringRef bufferName) {
  auto json = llvm::json::parse(data);
  if (!json)
    return makeCatalogError(bufferName, llvm::toString(json.takeError()));

  auto *topLevel = json->getAsObject();
  if (!topLevel)
    return makeCatalogError(bufferName, "top level value is not an object");

  auto *symbols = topLevel->getObject("symbols");
  if (!symbols)
    return makeCatalogError(bufferName, "missing 'symbols' object");

  auto *yearToRelease = topLevel->getObject("year_to_release");
  if (!yearToRelease)
    return makeCatalogError(bufferName, "missing 'year_to_release' object");

  NameAvailability result;

  for (const auto &entry : *symbols) {
    auto key = entry.second.getAsString();
    if (!key) {
      return makeCatalogError(bufferName, "availability key of symbol '" +
                                              entry.first.str() +
                                              "' is not a string");
    }
    result.addSymbol(entry.first.str(), *key);
  }

  for (const auto &entry : *yearToRelease) {
    StringRef releaseKey = entry.first;
    auto *platforms = entry.second.getAsObject();
    if (!platforms) {
      return makeCatalogError(bufferName, "release '" + releaseKey +
                                              "' is not an object");
    }

    ReleaseVersions versions;
    auto readVersion = [&](StringRef platform,
                           std::string &version) -> llvm::Error {
      auto value = platforms->getString(platform);
      if (!value) {
        return makeCatalogError(bufferName, "release '" + releaseKey +
                                                "' has no " + platform +
                                                " version");
      }
      version = value->str();
      return llvm::Error::success();
    };
    if (auto err = readVersion("iOS", versions.iOS))
      return std::move(err);
    if (auto err = readVersion("macOS", versions.macOS))
      return std::move(err);
    if (auto err = readVersion("tvOS", versions.tvOS))
      return std::move(err);
    if (auto err = readVersion("watchOS", versions.watchOS))
      return std::move(err);
    if (auto err = readVersion("visionOS", versions.visionOS))
      return std::move(err);

    result.addRelease(releaseKey, std::move(versions));
  }

  return std::move(result);
}

std::vector<StringRef> NameAvailability::getSortedSymbolNames() const {
  std::vector<StringRef> names;
  names.reserve(Symbols.size());
  for (const auto &entry : Symbols)
    names.push_back(entry.getKey());
  std::sort(names.begin(), names.end());
  return names;
}

std::optional<StringRef>
NameAvailability::getAvailabilityKey(StringRef symbol) const {
  auto found = Symbols.find(symbol);
  if (found == Symbols.end())
    return std::nullopt;
  return StringRef(found->getValue());
}

const ReleaseVersions *NameAvailability::lookupRelease(StringRef key) const {
  auto found = YearToRelease.find(key);
  if (found == YearToRelease.end())
    return nullptr;
  return &found->getValue();
}

llvm::Expected<const ReleaseVersions &>
NameAvailability::getReleaseVersions(StringRef symbol) const {
  auto key = getAvailabilityKey(symbol);
  if (!key) {
    return llvm::make_error<llvm::StringError>(
        "symbol '" + symbol + "' is not in the catalog",
        llvm::inconvertibleErrorCode());
  }
  auto *versions = lookupRelease(*key);
  if (!versions) {
    return llvm::make_error<llvm::StringError>(
        "symbol '" + symbol + "' refers to unknown availability key '" + *key +
            "'",
        llvm::inconvertibleErrorCode());
  }
  return *versions;
}

llvm::Expected<SymbolCatalog>
SymbolCatalog::loadFromDirectory(StringRef resourceDirectory) {
  auto pathTo = [&](StringRef fileName) {
    SmallString<256> path(resourceDirectory);
    llvm::sys::path::append(path, fileName);
    return std::string(path.str());
  };

  auto availability =
      NameAvailability::loadFromPath(pathTo("name_availability.json"));
  if (!availability)
    return availability.takeError();

  auto nameAliases = StringsTable::loadFromPath(pathTo("name_aliases.strings"));
  if (!nameAliases)
    return nameAliases.takeError();

  auto noFillToFill =
      StringsTable::loadFromPath(pathTo("nofill_to_fill.strings"));
  if (!noFillToFill)
    return noFillToFill.takeError();

  auto semanticToDescriptive = StringsTable::loadFromPath(
      pathTo("semantic_to_descriptive_name.strings"));
  if (!semanticToDescriptive)
    return semanticToDescriptive.takeError();

  auto symbolRestrictions =
      StringsTable::loadFromPath(pathTo("symbol_restrictions.strings"));
  if (!symbolRestrictions)
    return symbolRestrictions.takeError();

  return SymbolCatalog(std::move(*availability), std::move(*nameAliases),
                       std::move(*noFillToFill),
                       std::move(*semanticToDescriptive),
                       std::move(*symbolRestrictions));
}
