//===--- sfgenerate_main.cpp - Generate Swift accessors for SF Symbols ----===//
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
// sfgenerate reads the SF Symbols resource catalog and writes a Swift source
// file declaring a type-safe accessor for every symbol.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Basic/PrettyStackTrace.h"
#include "sfsymbols/Basic/Version.h"
#include "sfsymbols/Catalog/SymbolCatalog.h"
#include "sfsymbols/DriverTool/SFGenerateOptions.h"
#include "sfsymbols/Frontend/GenerateFrontend.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/ToolOutputFile.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

using namespace sfsymbols;

static void printVersion(llvm::raw_ostream &OS) {
  OS << version::getFullVersion() << '\n';
}

static int reportError(const Twine &message) {
  llvm::WithColor::error(llvm::errs(), "sfgenerate") << message << '\n';
  return 1;
}

int sfsymbols::sfgenerate_main(ArrayRef<const char *> argv) {
  PrettyStackTraceGeneratorVersion versionStackTrace;

  SFGenerateOptions cl;
  llvm::cl::HideUnrelatedOptions(cl.Category);
  llvm::cl::SetVersionPrinter(printVersion);
  if (!llvm::cl::ParseCommandLineOptions(
          argv.size(), argv.data(), "SF Symbols accessor generator\n",
          &llvm::errs(), "SFGENERATE_OPTIONS"))
    return 1;

  if (cl.PrintStats)
    llvm::EnableStatistics(/*DoPrintOnExit=*/false);

  auto options = cl.translate();
  if (!options)
    return reportError(llvm::toString(options.takeError()));

  auto catalog = SymbolCatalog::loadFromDirectory(cl.ResourceDirectory);
  if (!catalog)
    return reportError(llvm::toString(catalog.takeError()));

  GenerateFrontend frontend(*catalog, *options);
  auto source = frontend.generate();
  if (!source)
    return reportError(llvm::toString(source.takeError()));

  std::error_code EC;
  llvm::ToolOutputFile out(cl.OutputFilename, EC, llvm::sys::fs::OF_Text);
  if (EC)
    return reportError(cl.OutputFilename + ": " + EC.message());

  out.os() << *source;
  out.os().flush();
  if (out.os().has_error()) {
    std::error_code writeError = out.os().error();
    out.os().clear_error();
    return reportError(cl.OutputFilename + ": " + writeError.message());
  }
  out.keep();

  if (cl.PrintStats)
    llvm::PrintStatistics(llvm::errs());
  return 0;
}
