//===--- Attr.h - Attributes on generated declarations ----------*- C++ -*-===//
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
// This file defines AvailableAttr, the @available attribute attached to
// generated declarations.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_ATTR_H
#define SFSYMBOLS_REPRESENTATION_ATTR_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Basic/PlatformKind.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>

namespace sfsymbols {

/// A platform together with the first version it supports.
struct PlatformVersion {
  PlatformKind Platform;
  std::string Version;
};

/// Describes an @available attribute.
class AvailableAttr {
public:
  enum class Kind : uint8_t {
    /// @available(iOS 13.0, macOS 10.15, *)
    Introduced,
    /// @available(*, deprecated, message: "...", renamed: "...")
    Deprecated,
    /// @available(watchOS, unavailable)
    Unavailable,
  };

private:
  Kind TheKind;
  SmallVector<PlatformVersion, 6> Platforms;
  std::optional<std::string> Message;
  std::optional<std::string> Renamed;
  PlatformKind UnavailablePlatform = PlatformKind::none;

  explicit AvailableAttr(Kind kind) : TheKind(kind) {}

public:
  /// Create an attribute introducing the declaration on each of the given
  /// platforms, in the given order. The trailing "*" is implicit.
  static AvailableAttr createIntroduced(ArrayRef<PlatformVersion> platforms);

  /// Create an unconditional deprecation.
  static AvailableAttr
  createDeprecated(std::optional<StringRef> message = std::nullopt,
                   std::optional<StringRef> renamed = std::nullopt);

  /// Create an attribute marking the declaration unavailable on
  /// \p platform.
  static AvailableAttr createUnavailable(PlatformKind platform);

  Kind getKind() const { return TheKind; }

  ArrayRef<PlatformVersion> getPlatforms() const { return Platforms; }

  /// Returns the version for \p platform, if the attribute names it.
  std::optional<StringRef> getVersion(PlatformKind platform) const;

  std::optional<StringRef> getMessage() const {
    if (!Message)
      return std::nullopt;
    return StringRef(*Message);
  }

  std::optional<StringRef> getRenamed() const {
    if (!Renamed)
      return std::nullopt;
    return StringRef(*Renamed);
  }

  PlatformKind getUnavailablePlatform() const { return UnavailablePlatform; }

  /// Print the attribute on a single line, e.g.
  /// "@available(iOS 13.0, macOS 10.15, *)".
  void print(raw_ostream &OS) const;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_ATTR_H
