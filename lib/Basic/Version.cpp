//===--- Version.cpp - Generator version number ---------------------------===//
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
// This file defines several version-related utility functions.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/Version.h"
#include "llvm/Support/raw_ostream.h"

#define TOSTR2(X) #X
#define TOSTR(X) TOSTR2(X)

#ifndef SFSYMBOLS_VERSION_MAJOR
#error "SFSYMBOLS_VERSION_MAJOR must be defined by the build"
#endif

#ifdef SFSYMBOLS_VERSION_PATCHLEVEL
/// Helper macro for SFSYMBOLS_VERSION_STRING.
#define SFSYMBOLS_MAKE_VERSION_STRING(X, Y, Z)                                 \
  TOSTR(X) "." TOSTR(Y) "." TOSTR(Z)

/// A string that describes the generator version number, e.g., "1.0.0".
#define SFSYMBOLS_VERSION_STRING                                               \
  SFSYMBOLS_MAKE_VERSION_STRING(SFSYMBOLS_VERSION_MAJOR,                       \
                                SFSYMBOLS_VERSION_MINOR,                       \
                                SFSYMBOLS_VERSION_PATCHLEVEL)
#else
/// Helper macro for SFSYMBOLS_VERSION_STRING.
#define SFSYMBOLS_MAKE_VERSION_STRING(X, Y) TOSTR(X) "." TOSTR(Y)

/// A string that describes the generator version number, e.g., "1.0".
#define SFSYMBOLS_VERSION_STRING                                               \
  SFSYMBOLS_MAKE_VERSION_STRING(SFSYMBOLS_VERSION_MAJOR,                       \
                                SFSYMBOLS_VERSION_MINOR)
#endif

namespace sfsymbols {
namespace version {

StringRef getVersionString() {
  return SFSYMBOLS_VERSION_STRING;
}

StringRef getRevision() {
#ifdef SFSYMBOLS_REVISION
  return SFSYMBOLS_REVISION;
#else
  return "";
#endif
}

std::string getFullVersion() {
  std::string buf;
  llvm::raw_string_ostream OS(buf);

  OS << "sfgenerate version " SFSYMBOLS_VERSION_STRING;

  // Arbitrarily truncate to 15 characters. This should be enough to unique
  // Git hashes.
  StringRef revision = getRevision();
  if (!revision.empty())
    OS << " (" << revision.slice(0, 15) << ")";

  return OS.str();
}

} // end namespace version
} // end namespace sfsymbols
