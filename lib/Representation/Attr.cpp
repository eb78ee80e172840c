//===--- Attr.cpp - Attributes on generated declarations ------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/Attr.h"
#include "sfsymbols/Basic/QuotedString.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <cassert>

using namespace sfsymbols;

AvailableAttr
AvailableAttr::createIntroduced(ArrayRef<PlatformVersion> platforms) {
  AvailableAttr attr(Kind::Introduced);
  attr.Platforms.append(platforms.begin(), platforms.end());
  return attr;
}

AvailableAttr
AvailableAttr::createDeprecated(std::optional<StringRef> message,
                                std::optional<StringRef> renamed) {
  AvailableAttr attr(Kind::Deprecated);
  if (message)
    attr.Message = message->str();
  if (renamed)
    attr.Renamed = renamed->str();
  return attr;
}

AvailableAttr AvailableAttr::createUnavailable(PlatformKind platform) {
  assert(platform != PlatformKind::none && "use a deprecation instead");
  AvailableAttr attr(Kind::Unavailable);
  attr.UnavailablePlatform = platform;
  return attr;
}

std::optional<StringRef>
AvailableAttr::getVersion(PlatformKind platform) const {
  for (const auto &entry : Platforms)
    if (entry.Platform == platform)
      return StringRef(entry.Version);
  return std::nullopt;
}

void AvailableAttr::print(raw_ostream &OS) const {
  OS << "@available(";
  switch (TheKind) {
  case Kind::Introduced:
    for (const auto &entry : Platforms)
      OS << platformString(entry.Platform) << ' ' << entry.Version << ", ";
    OS << '*';
    break;

  case Kind::Deprecated:
    OS << "*, deprecated";
    if (Message)
      OS << ", message: " << QuotedString(*Message);
    if (Renamed)
      OS << ", renamed: " << QuotedString(*Renamed);
    break;

  case Kind::Unavailable:
    OS << platformString(UnavailablePlatform) << ", unavailable";
    break;
  }
  OS << ')';
}
