//===--- sfgenerate.cpp - Generate Swift accessors for SF Symbols ---------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/DriverTool/SFGenerateOptions.h"
#include "llvm/Support/InitLLVM.h"

int main(int argc, char **argv) {
  llvm::InitLLVM initLLVM(argc, argv);
  return sfsymbols::sfgenerate_main(
      llvm::makeArrayRef(const_cast<const char **>(argv), argc));
}
