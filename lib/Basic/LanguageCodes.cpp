//===--- LanguageCodes.cpp - Localized symbol name suffixes ---------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/LanguageCodes.h"
#include "llvm/ADT/StringSet.h"

using namespace sfsymbols;

bool sfsymbols::isLanguageCode(StringRef code) {
  static const llvm::StringSet<> Codes = {
#define LANGUAGE_CODE(Code) Code,
#include "sfsymbols/Basic/LanguageCodes.def"
  };
  return Codes.count(code) != 0;
}

bool sfsymbols::hasLanguageCodeSuffix(StringRef symbolName) {
  return isLanguageCode(symbolName.substr(symbolName.rfind('.') + 1));
}

bool sfsymbols::hasRightToLeftSuffix(StringRef symbolName) {
  return symbolName.endswith(".rtl");
}
