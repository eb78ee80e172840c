//===--- File.h - A generated source file -----------------------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_FILE_H
#define SFSYMBOLS_REPRESENTATION_FILE_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Representation/CodeBlock.h"
#include "sfsymbols/Representation/Comment.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>
#include <vector>

namespace sfsymbols {

/// An import statement.
struct ImportDescription {
  /// When the import is marked @preconcurrency.
  enum class PreconcurrencyKind : uint8_t {
    Never,
    Always,
    /// Only on the operating systems in \c PreconcurrencyOSes; the import
    /// is duplicated under "#if os(...)" / "#else".
    OnOS,
  };

  std::string ModuleName;

  /// Specific declarations to import ("import struct Foundation.URL");
  /// one import statement is written per entry.
  std::vector<std::string> ModuleTypes;

  /// The SPI group, written as "@_spi(Group)".
  std::optional<std::string> SPI;

  /// Modules checked with "#if canImport(A) || canImport(B)" around the
  /// import; empty for an unconditional import.
  std::vector<std::string> CanImportModules;

  PreconcurrencyKind Preconcurrency = PreconcurrencyKind::Never;
  std::vector<std::string> PreconcurrencyOSes;

  /// An unconditional "import Module".
  static ImportDescription get(StringRef moduleName) {
    ImportDescription result;
    result.ModuleName = moduleName.str();
    return result;
  }

  /// "import Module" guarded by "#if canImport(Module)".
  static ImportDescription getGuarded(StringRef moduleName) {
    ImportDescription result = get(moduleName);
    result.CanImportModules.push_back(moduleName.str());
    return result;
  }
};

/// The contents of a generated Swift source file.
struct FileDescription {
  std::optional<Comment> TopComment;
  std::vector<ImportDescription> Imports;
  CodeBlocks Blocks;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_FILE_H
