//===--- LLVM.h - Import various common LLVM datatypes ----------*- C++ -*-===//
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
// This file forward declares and imports various common LLVM datatypes that
// the generator wants to use unqualified.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_BASIC_LLVM_H
#define SFSYMBOLS_BASIC_LLVM_H

// Do not proliferate #includes here, require clients to #include their
// dependencies.
// Casting.h has complex templates that cannot be easily forward declared.
#include "llvm/Support/Casting.h"
// None.h includes an enumerator that is desired & cannot be forward declared
// without a definition of NoneType.
#include "llvm/ADT/None.h"

// Forward declarations.
namespace llvm {
  // Containers.
  class StringRef;
  class StringLiteral;
  class Twine;
  template <typename T> class SmallVectorImpl;
  template <typename T, unsigned N> class SmallVector;
  template <unsigned N> class SmallString;
  template <typename T> class ArrayRef;
  template <typename T> class MutableArrayRef;
  template <typename T> class Expected;
  class Error;

  // Other common classes.
  class raw_ostream;
} // end namespace llvm

namespace sfsymbols {
  // Casting operators.
  using llvm::isa;
  using llvm::cast;
  using llvm::dyn_cast;
  using llvm::dyn_cast_or_null;
  using llvm::cast_or_null;

  // Containers.
  using llvm::ArrayRef;
  using llvm::MutableArrayRef;
  using llvm::SmallString;
  using llvm::SmallVector;
  using llvm::SmallVectorImpl;
  using llvm::StringLiteral;
  using llvm::StringRef;
  using llvm::Twine;

  // Other common classes.
  using llvm::raw_ostream;
} // end namespace sfsymbols

#endif // SFSYMBOLS_BASIC_LLVM_H
