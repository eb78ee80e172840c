//===--- SFGenerateOptions.h - sfgenerate command line ----------*- C++ -*-===//
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
// The command line options of sfgenerate. Constructing an SFGenerateOptions
// registers its options with the global llvm::cl parser.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_DRIVERTOOL_SFGENERATEOPTIONS_H
#define SFSYMBOLS_DRIVERTOOL_SFGENERATEOPTIONS_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Frontend/GenerateOptions.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Error.h"
#include <string>

namespace sfsymbols {

struct SFGenerateOptions {
  llvm::cl::OptionCategory Category =
      llvm::cl::OptionCategory("sfgenerate options");

  llvm::cl::opt<std::string> ResourceDirectory =
      llvm::cl::opt<std::string>(
          "resources",
          llvm::cl::desc(
              "The directory that holds the SF Symbols catalog: "
              "name_availability.json and the .strings tables. Convert "
              "the name_availability.plist of CoreGlyphs.bundle with "
              "'plutil -convert json'"),
          llvm::cl::value_desc("dir"), llvm::cl::Required,
          llvm::cl::cat(Category));

  llvm::cl::opt<std::string> OutputFilename = llvm::cl::opt<std::string>(
      "o", llvm::cl::desc("Output file, or '-' for standard output"),
      llvm::cl::value_desc("file"), llvm::cl::init("-"),
      llvm::cl::cat(Category));

  llvm::cl::opt<std::string> Access = llvm::cl::opt<std::string>(
      "access-modifier",
      llvm::cl::desc("Access level of the generated declarations "
                     "(public, package, internal, fileprivate, private)"),
      llvm::cl::init("internal"), llvm::cl::cat(Category));

  llvm::cl::list<std::string> EnabledExtensions =
      llvm::cl::list<std::string>(
          "enabled-extensions",
          llvm::cl::desc("Image types that mirror the accessors "
                         "(AppKit, SwiftUI, UIKit), or 'none'"),
          llvm::cl::CommaSeparated, llvm::cl::cat(Category));

  llvm::cl::opt<bool> ExportSemanticSymbols = llvm::cl::opt<bool>(
      "export-semantic-symbols",
      llvm::cl::desc("Export semantic names as aliases of the symbol "
                     "they draw"),
      llvm::cl::init(true), llvm::cl::cat(Category));

  llvm::cl::alias ExportSemanticSymbolsShort = llvm::cl::alias(
      "s", llvm::cl::desc("Alias for --export-semantic-symbols"),
      llvm::cl::aliasopt(ExportSemanticSymbols));

  llvm::cl::opt<bool> NoExportSemanticSymbols = llvm::cl::opt<bool>(
      "no-export-semantic-symbols",
      llvm::cl::desc("Do not export semantic names"), llvm::cl::cat(Category));

  llvm::cl::opt<LocalizationFlag> Localization =
      llvm::cl::opt<LocalizationFlag>(
          llvm::cl::desc("Localized variants to export:"),
          llvm::cl::values(
              clEnumValN(LocalizationFlag::Both, "a",
                         "Export every localized variant"),
              clEnumValN(LocalizationFlag::Both, "export-all",
                         "Export every localized variant"),
              clEnumValN(LocalizationFlag::Both, "export-all-localizations",
                         "Export every localized variant"),
              clEnumValN(LocalizationFlag::LanguageCode, "l",
                         "Export language code variants"),
              clEnumValN(LocalizationFlag::LanguageCode, "export-lang",
                         "Export language code variants"),
              clEnumValN(LocalizationFlag::LanguageCode,
                         "export-language-code",
                         "Export language code variants"),
              clEnumValN(LocalizationFlag::RightToLeft, "r",
                         "Export right-to-left variants"),
              clEnumValN(LocalizationFlag::RightToLeft, "export-rtl",
                         "Export right-to-left variants"),
              clEnumValN(LocalizationFlag::RightToLeft,
                         "export-right-to-left",
                         "Export right-to-left variants")),
          llvm::cl::cat(Category));

  // LLVM registers its own "-stats", which enables statistics without
  // printing them to a stream we control.
  llvm::cl::opt<bool> PrintStats = llvm::cl::opt<bool>(
      "print-stats", llvm::cl::desc("Print generation statistics"),
      llvm::cl::cat(Category));

  /// Build the generator configuration from the parsed command line.
  /// Fails on an unknown access modifier or extension name.
  llvm::Expected<GenerateOptions> translate() const;
};

/// The body of sfgenerate. \p argv includes the program name.
int sfgenerate_main(ArrayRef<const char *> argv);

} // end namespace sfsymbols

#endif // SFSYMBOLS_DRIVERTOOL_SFGENERATEOPTIONS_H
