//===--- GenerateFrontend.cpp - Generate the symbol accessors -------------===//
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
// The generated file has this shape:
//
//   import Foundation
//   #if canImport(UIKit)
//   import UIKit
//   #endif
//
//   struct SFSymbolResource: Hashable { ... }
//
//   extension SFSymbolResource {
//       /// The "message.circle" SF Symbol.
//       ///
//       @available(iOS 13.0, macOS 10.15, ...)
//       static var messageCircle: SFSymbolResource { ... }
//   }
//
//   #if canImport(UIKit) && !os(watchOS)
//   extension UIKit.UIImage { convenience init(systemSymbolResource:) }
//   extension UIKit.UIImage { static var messageCircle: UIKit.UIImage }
//   #endif
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Frontend/GenerateFrontend.h"
#include "sfsymbols/Basic/Identifier.h"
#include "sfsymbols/Basic/LanguageCodes.h"
#include "sfsymbols/Basic/PrettyStackTrace.h"
#include "sfsymbols/Basic/Version.h"
#include "sfsymbols/Render/TextRenderer.h"
#include "sfsymbols/Representation/Expr.h"
#include "llvm/ADT/Statistic.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/ErrorHandling.h"

#define DEBUG_TYPE "generate-frontend"

using namespace sfsymbols;

STATISTIC(NumCatalogSymbols, "# of symbols in the catalog");
STATISTIC(NumFilteredLanguageCode,
          "# of language code variants filtered out");
STATISTIC(NumFilteredRightToLeft,
          "# of right-to-left variants filtered out");
STATISTIC(NumAccessors, "# of symbol accessors emitted");
STATISTIC(NumSemanticAliases, "# of semantic alias accessors emitted");

static constexpr const char *ResourceTypeName = "SFSymbolResource";

namespace {

/// What differs between the companion image extensions.
struct CompanionInfo {
  /// The "#if" condition around the extensions.
  const char *Condition;
  /// The fully qualified image type.
  const char *ImageType;
  /// The image type as named in documentation.
  const char *ShortImageType;
  /// The first releases shipping the symbol initializers.
  SmallVector<PlatformVersion, 4> Introduced;
  /// Platforms where the image type has no symbol initializer.
  SmallVector<PlatformKind, 1> Unavailable;
  /// Whether the image type is a class, requiring a convenience
  /// initializer that force-unwraps the failable one.
  bool IsClass;
};

} // end anonymous namespace

static CompanionInfo getCompanionInfo(CompanionExtension extension) {
  switch (extension) {
  case CompanionExtension::AppKit:
    return {"canImport(AppKit)",
            "AppKit.NSImage",
            "NSImage",
            {{PlatformKind::macOS, "11.0"}},
            {},
            /*IsClass=*/true};
  case CompanionExtension::SwiftUI:
    return {"canImport(SwiftUI)",
            "SwiftUI.Image",
            "Image",
            {{PlatformKind::iOS, "13.0"},
             {PlatformKind::macOS, "10.15"},
             {PlatformKind::tvOS, "13.0"},
             {PlatformKind::watchOS, "6.0"}},
            {},
            /*IsClass=*/false};
  case CompanionExtension::UIKit:
    return {"canImport(UIKit) && !os(watchOS)",
            "UIKit.UIImage",
            "UIImage",
            {{PlatformKind::iOS, "13.0"}, {PlatformKind::tvOS, "13.0"}},
            {PlatformKind::watchOS},
            /*IsClass=*/true};
  }
  llvm_unreachable("bad CompanionExtension");
}

/// The companion extensions in the order they are written.
static const CompanionExtension AllCompanionExtensions[] = {
    CompanionExtension::AppKit,
    CompanionExtension::SwiftUI,
    CompanionExtension::UIKit,
};

/// "base.member"
static ExprPtr makeMemberAccess(StringRef base, StringRef member) {
  return MemberAccessExpr::create(IdentifierExpr::create(base), member);
}

/// "callee(label: value)"
static std::unique_ptr<CallExpr> makeCall(ExprPtr callee, StringRef label,
                                          ExprPtr value) {
  std::vector<CallArgument> args;
  args.emplace_back(label.str(), std::move(value));
  return CallExpr::create(std::move(callee), std::move(args));
}

static CodeBlocks makeBody(ExprPtr E) {
  CodeBlocks body;
  body.push_back(CodeBlock::get(std::move(E)));
  return body;
}

GenerateFrontend::GenerateFrontend(const SymbolCatalog &catalog,
                                   GenerateOptions options)
    : Catalog(catalog), Options(options) {
  // Attributes are inserted right below the documentation, so the last
  // attribute added is written first.
  Mutators.push_back(
      std::make_unique<DeprecationMutator>(Catalog.getNameAliases()));
  Mutators.push_back(
      std::make_unique<AvailabilityMutator>(Catalog.getAvailability()));
  Mutators.push_back(
      std::make_unique<RestrictionMutator>(Catalog.getSymbolRestrictions()));
}

bool GenerateFrontend::isExported(StringRef symbolName) const {
  if (!Options.Localizations.contains(LocalizationOption::LanguageCode) &&
      hasLanguageCodeSuffix(symbolName)) {
    ++NumFilteredLanguageCode;
    return false;
  }
  if (!Options.Localizations.contains(LocalizationOption::RightToLeft) &&
      hasRightToLeftSuffix(symbolName)) {
    ++NumFilteredRightToLeft;
    return false;
  }
  return true;
}

std::vector<StringRef> GenerateFrontend::collectSymbolNames() const {
  std::vector<StringRef> names;
  for (StringRef name : Catalog.getAvailability().getSortedSymbolNames()) {
    ++NumCatalogSymbols;
    if (isExported(name))
      names.push_back(name);
  }
  return names;
}

llvm::Expected<std::vector<SymbolAccessor>>
GenerateFrontend::collectAccessors() const {
  const NameAvailability &availability = Catalog.getAvailability();
  std::vector<StringRef> names = collectSymbolNames();

  std::vector<SymbolAccessor> accessors;
  llvm::StringMap<std::string> namesByIdentifier;

  auto addAccessor = [&](SymbolAccessor accessor) -> llvm::Error {
    if (accessor.Identifier.empty()) {
      return llvm::make_error<llvm::StringError>(
          "symbol '" + accessor.Name + "' does not derive a Swift identifier",
          llvm::inconvertibleErrorCode());
    }
    auto inserted =
        namesByIdentifier.try_emplace(accessor.Identifier, accessor.Name);
    if (!inserted.second) {
      return llvm::make_error<llvm::StringError>(
          "symbols '" + inserted.first->getValue() + "' and '" +
              accessor.Name + "' both derive the identifier '" +
              accessor.Identifier + "'",
          llvm::inconvertibleErrorCode());
    }
    accessors.push_back(std::move(accessor));
    return llvm::Error::success();
  };

  for (StringRef name : names) {
    // Every accessor carries an @available attribute; a symbol whose
    // availability key is unknown cannot be generated.
    auto versions = availability.getReleaseVersions(name);
    if (!versions)
      return versions.takeError();

    SymbolAccessor accessor;
    accessor.Identifier = deriveIdentifier(name);
    accessor.Name = name.str();
    if (auto err = addAccessor(std::move(accessor)))
      return std::move(err);
  }

  if (!Options.ExportSemanticSymbols)
    return std::move(accessors);

  llvm::StringSet<> exported;
  for (StringRef name : names)
    exported.insert(name);

  const StringsTable &semanticNames = Catalog.getSemanticToDescriptive();
  for (StringRef semantic : semanticNames.getSortedKeys()) {
    StringRef target = *semanticNames.lookup(semantic);
    // A semantic name that is a symbol of its own already has an accessor.
    if (availability.hasSymbol(semantic) || !isExported(semantic) ||
        !exported.count(target))
      continue;

    SymbolAccessor accessor;
    accessor.Identifier = deriveIdentifier(semantic);
    accessor.Name = semantic.str();
    accessor.AliasOf = target.str();
    accessor.AliasOfIdentifier = deriveIdentifier(target);
    if (auto err = addAccessor(std::move(accessor)))
      return std::move(err);
  }

  return std::move(accessors);
}

DeclPtr GenerateFrontend::applyMutators(DeclPtr D,
                                        StringRef symbolName) const {
  for (const auto &mutator : Mutators)
    D = mutator->mutate(std::move(D), symbolName);
  return D;
}

std::string
GenerateFrontend::getDocumentation(const SymbolAccessor &accessor) const {
  std::string doc = "The \"" + accessor.Name + "\" SF Symbol.\n";
  if (accessor.isAlias())
    doc += "\nAn alias of the \"" + *accessor.AliasOf + "\" SF Symbol.\n";
  return doc;
}

DeclPtr
GenerateFrontend::makeResourceAccessor(const SymbolAccessor &accessor) const {
  PrettyStackTraceStringAction trace("generating accessor for",
                                     accessor.Name);

  ExprPtr value;
  if (accessor.isAlias()) {
    value = MemberAccessExpr::createImplicit(*accessor.AliasOfIdentifier);
  } else {
    value = makeCall(IdentifierExpr::create(ResourceTypeName), "systemName",
                     StringLiteralExpr::create(accessor.Name));
  }

  auto var = VarDecl::create(getAccess(), /*isStatic=*/true, BindingKind::Var,
                             accessor.Identifier,
                             ExistingType::getNamed(ResourceTypeName));
  var->setGetter(makeBody(std::move(value)));

  if (accessor.isAlias())
    ++NumSemanticAliases;
  else
    ++NumAccessors;

  return applyMutators(
      CommentableDecl::create(Comment::getDoc(getDocumentation(accessor)),
                              std::move(var)),
      accessor.getMutationKey());
}

DeclPtr
GenerateFrontend::makeImageAccessor(const SymbolAccessor &accessor,
                                    CompanionExtension extension) const {
  PrettyStackTraceStringAction trace("generating image accessor for",
                                     accessor.Name);
  CompanionInfo info = getCompanionInfo(extension);

  ExistingType imageType = ExistingType::getNamed(info.ImageType);
  auto value = makeCall(TypeExpr::create(imageType), "systemSymbolResource",
                        MemberAccessExpr::createImplicit(accessor.Identifier));

  auto var = VarDecl::create(getAccess(), /*isStatic=*/true, BindingKind::Var,
                             accessor.Identifier, imageType);
  var->setGetter(makeBody(std::move(value)));

  return applyMutators(
      CommentableDecl::create(Comment::getDoc(getDocumentation(accessor)),
                              std::move(var)),
      accessor.getMutationKey());
}

CodeBlock GenerateFrontend::makeSupportType() const {
  auto resource = StructDecl::create(getAccess(), ResourceTypeName,
                                     {std::string("Hashable")});

  auto systemName =
      VarDecl::create(AccessModifier::FilePrivate, /*isStatic=*/false,
                      BindingKind::Let, "systemName",
                      ExistingType::getNamed("String"));
  resource->addMember(CommentableDecl::create(
      Comment::getDoc("A SFSymbol system name."), std::move(systemName)));

  std::vector<FunctionParameter> params;
  params.emplace_back(std::string("systemName"), std::string("name"),
                      ExistingType::getNamed("String"));
  auto init = FuncDecl::createInit(getAccess(), /*isFailable=*/false,
                                   std::move(params));
  init->setBody(makeBody(AssignExpr::create(
      makeMemberAccess("self", "systemName"), IdentifierExpr::create("name"))));
  resource->addMember(CommentableDecl::create(
      Comment::getDoc("Initialize a `SFSymbolResource` with `systemName`."),
      std::move(init)));

  return CodeBlock::get(
      CommentableDecl::create(Comment::getDoc("A SFSymbol resource."),
                              std::move(resource)),
      Comment::getMark(ResourceTypeName, /*sectionBreak=*/true));
}

CodeBlock GenerateFrontend::makeResourceExtension(
    ArrayRef<SymbolAccessor> accessors) const {
  auto extension = ExtensionDecl::create(std::nullopt, ResourceTypeName);
  for (const auto &accessor : accessors)
    extension->addMember(makeResourceAccessor(accessor));
  return CodeBlock::get(std::move(extension),
                        Comment::getMark("Symbols", /*sectionBreak=*/true));
}

/// Wrap \p D in the availability of the companion image type.
static DeclPtr addCompanionAvailability(DeclPtr D, const CompanionInfo &info) {
  for (PlatformKind platform : info.Unavailable)
    D = AttributedDecl::create(AvailableAttr::createUnavailable(platform),
                               std::move(D));
  return AttributedDecl::create(
      AvailableAttr::createIntroduced(info.Introduced), std::move(D));
}

CodeBlock
GenerateFrontend::makeCompanionBlock(ArrayRef<SymbolAccessor> accessors,
                                     CompanionExtension extension) const {
  CompanionInfo info = getCompanionInfo(extension);
  StringRef moduleName = getCompanionExtensionName(extension);

  // The initializer taking a resource.
  std::vector<FunctionParameter> params;
  params.emplace_back(std::string("systemSymbolResource"),
                      std::string("resource"),
                      ExistingType::getNamed(ResourceTypeName));
  auto init = FuncDecl::createInit(getAccess(), /*isFailable=*/false,
                                   std::move(params));

  ExprPtr delegation;
  if (extension == CompanionExtension::AppKit) {
    std::vector<CallArgument> args;
    args.emplace_back(std::string("systemSymbolName"),
                      makeMemberAccess("resource", "systemName"));
    args.emplace_back(std::string("accessibilityDescription"),
                      NilLiteralExpr::create());
    delegation =
        CallExpr::create(makeMemberAccess("self", "init"), std::move(args));
  } else {
    delegation = makeCall(makeMemberAccess("self", "init"), "systemName",
                          makeMemberAccess("resource", "systemName"));
  }
  if (info.IsClass) {
    init->setConvenience();
    delegation = ForceValueExpr::create(std::move(delegation));
  }
  init->setBody(makeBody(std::move(delegation)));

  auto initExtension = ExtensionDecl::create(std::nullopt, info.ImageType);
  initExtension->addMember(CommentableDecl::create(
      Comment::getDoc((Twine("Initialize a `") + info.ShortImageType +
                       "` with a SFSymbol resource.")
                          .str()),
      std::move(init)));

  auto accessorExtension = ExtensionDecl::create(std::nullopt, info.ImageType);
  for (const auto &accessor : accessors)
    accessorExtension->addMember(makeImageAccessor(accessor, extension));

  CodeBlocks elements;
  elements.push_back(
      CodeBlock::get(addCompanionAvailability(std::move(initExtension), info)));
  elements.push_back(CodeBlock::get(
      addCompanionAvailability(std::move(accessorExtension), info)));

  return CodeBlock::get(
      IfConfigDecl::create(info.Condition, std::move(elements)),
      Comment::getMark(moduleName, /*sectionBreak=*/true));
}

llvm::Expected<FileDescription> GenerateFrontend::buildFile() const {
  auto accessors = collectAccessors();
  if (!accessors)
    return accessors.takeError();

  FileDescription file;
  file.TopComment = Comment::getInline(
      (Twine("This file was generated by sfgenerate ") +
       version::getVersionString() + ".\nDo not edit it by hand.")
          .str());

  file.Imports.push_back(ImportDescription::get("Foundation"));
  for (CompanionExtension extension : AllCompanionExtensions) {
    if (Options.Extensions.contains(extension))
      file.Imports.push_back(
          ImportDescription::getGuarded(getCompanionExtensionName(extension)));
  }

  file.Blocks.push_back(makeSupportType());
  file.Blocks.push_back(makeResourceExtension(*accessors));
  for (CompanionExtension extension : AllCompanionExtensions) {
    if (Options.Extensions.contains(extension))
      file.Blocks.push_back(makeCompanionBlock(*accessors, extension));
  }
  return std::move(file);
}

llvm::Expected<std::string> GenerateFrontend::generate() const {
  auto file = buildFile();
  if (!file)
    return file.takeError();
  return renderFile(*file);
}
