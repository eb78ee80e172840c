//===--- StringsFile.h - Old-style property list string tables --*- C++ -*-===//
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
// This file declares StringsTable, the contents of a ".strings" file in the
// old-style (OpenStep) property list format:
//
//   /* comment */
//   "key" = "value";
//   // comment
//   unquoted.key = "value";
//   "key alone";
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_CATALOG_STRINGSFILE_H
#define SFSYMBOLS_CATALOG_STRINGSFILE_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llvm {
  class MemoryBuffer;
}

namespace sfsymbols {

/// A key to string map read from a ".strings" file.
class StringsTable {
  llvm::StringMap<std::string> Entries;

public:
  /// Reads and parses the file at \p path.
  static llvm::Expected<StringsTable> loadFromPath(StringRef path);

  /// Parses \p data; \p bufferName is used in error messages.
  static llvm::Expected<StringsTable>
  loadFromBuffer(StringRef data, StringRef bufferName = "<buffer>");

  static llvm::Expected<StringsTable>
  loadFromBuffer(std::unique_ptr<llvm::MemoryBuffer> buffer);

  /// Returns the value stored for \p key, if any.
  std::optional<StringRef> lookup(StringRef key) const;

  bool contains(StringRef key) const { return Entries.count(key) != 0; }

  size_t size() const { return Entries.size(); }
  bool empty() const { return Entries.empty(); }

  /// Adds or replaces an entry. A key appearing twice in a file keeps the
  /// last value.
  void set(StringRef key, StringRef value) { Entries[key] = value.str(); }

  /// The keys in byte order.
  std::vector<StringRef> getSortedKeys() const;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_CATALOG_STRINGSFILE_H
