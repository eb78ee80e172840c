//===--- PlatformKind.h - Availability platform kinds -----------*- C++ -*-===//
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
// This file defines the platform kinds for API availability.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_PLATFORMKIND_H
#define SFSYMBOLS_BASIC_PLATFORMKIND_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <optional>

namespace sfsymbols {

/// Available platforms for the availability attribute.
enum class PlatformKind : uint8_t {
  none,
#define AVAILABILITY_PLATFORM(X) X,
#include "sfsymbols/Basic/PlatformKinds.def"
};

/// The number of platforms, not counting \c PlatformKind::none.
enum : unsigned {
  NumPlatformKinds = 0
#define AVAILABILITY_PLATFORM(X) +1
#include "sfsymbols/Basic/PlatformKinds.def"
};

/// Returns the short string representing the platform, suitable for
/// use in availability specifications (e.g., "macOS").
StringRef platformString(PlatformKind platform);

/// Returns the platform kind corresponding to the passed-in short platform
/// name, or std::nullopt if such a platform kind does not exist.
std::optional<PlatformKind> platformFromString(StringRef Name);

} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_PLATFORMKIND_H
