//===--- PlatformKind.cpp - Availability platform kinds -------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//
//
// This file implements the platform kinds for API availability.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/PlatformKind.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace sfsymbols;

StringRef sfsymbols::platformString(PlatformKind platform) {
  switch (platform) {
  case PlatformKind::none:
    return "*";
#define AVAILABILITY_PLATFORM(X)                                               \
  case PlatformKind::X:                                                        \
    return #X;
#include "sfsymbols/Basic/PlatformKinds.def"
  }
  llvm_unreachable("bad PlatformKind");
}

std::optional<PlatformKind> sfsymbols::platformFromString(StringRef Name) {
  if (Name == "*")
    return PlatformKind::none;
  return llvm::StringSwitch<std::optional<PlatformKind>>(Name)
#define AVAILABILITY_PLATFORM(X) .Case(#X, PlatformKind::X)
#include "sfsymbols/Basic/PlatformKinds.def"
      .Case("OSX", PlatformKind::macOS)
      .Default(std::optional<PlatformKind>());
}
