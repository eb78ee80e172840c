//===--- Version.h - Generator version number -------------------*- C++ -*-===//
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
/// \file
/// Defines version macros and version-related utility functions
/// for the generator.
///
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_VERSION_H
#define SFSYMBOLS_BASIC_VERSION_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace sfsymbols {
namespace version {

/// Retrieves the "x.y.z" version string of the generator.
StringRef getVersionString();

/// Retrieves the repository revision the generator was built from, if
/// known.
StringRef getRevision();

/// Retrieves a string representing the complete version of the generator,
/// suitable for use in --version output and crash reports.
std::string getFullVersion();

} // end namespace version
} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_VERSION_H
