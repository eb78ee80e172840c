//===--- DeclarationMutator.cpp - Per-symbol declaration transforms -------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Frontend/DeclarationMutator.h"
#include "sfsymbols/Catalog/SymbolCatalog.h"
#include "sfsymbols/Catalog/StringsFile.h"
#include "llvm/ADT/Statistic.h"

#define DEBUG_TYPE "declaration-mutator"

using namespace sfsymbols;

STATISTIC(NumAvailabilityAttrs, "# of @available attributes added");
STATISTIC(NumDeprecations, "# of declarations deprecated");
STATISTIC(NumRestrictions, "# of restriction callouts added");

DeclarationMutator::~DeclarationMutator() = default;

DeclPtr sfsymbols::addAttributeBelowComments(DeclPtr D, AvailableAttr attr) {
  if (auto *commentable = dyn_cast<CommentableDecl>(D.get())) {
    commentable->setInner(
        addAttributeBelowComments(commentable->takeInner(), std::move(attr)));
    return D;
  }
  return AttributedDecl::create(std::move(attr), std::move(D));
}

DeclPtr AvailabilityMutator::mutate(DeclPtr D, StringRef symbolName) const {
  auto key = Availability.getAvailabilityKey(symbolName);
  if (!key)
    return D;
  const ReleaseVersions *release = Availability.lookupRelease(*key);
  if (!release)
    return D;

  SmallVector<PlatformVersion, 6> platforms;
#define AVAILABILITY_PLATFORM(X)                                               \
  platforms.push_back(                                                         \
      {PlatformKind::X, release->getVersion(PlatformKind::X).str()});
#include "sfsymbols/Basic/PlatformKinds.def"

  ++NumAvailabilityAttrs;
  return addAttributeBelowComments(std::move(D),
                                   AvailableAttr::createIntroduced(platforms));
}

DeclPtr DeprecationMutator::mutate(DeclPtr D, StringRef symbolName) const {
  auto renamed = NameAliases.lookup(symbolName);
  if (!renamed)
    return D;

  ++NumDeprecations;
  return addAttributeBelowComments(
      std::move(D), AvailableAttr::createDeprecated(StringRef(Message),
                                                    *renamed));
}

DeclPtr RestrictionMutator::mutate(DeclPtr D, StringRef symbolName) const {
  auto restriction = Restrictions.lookup(symbolName);
  if (!restriction)
    return D;

  ++NumRestrictions;
  std::string callout = ("- Important: " + *restriction).str();

  if (auto *commentable = dyn_cast<CommentableDecl>(D.get())) {
    const auto &comment = commentable->getComment();
    if (comment && comment->isDoc()) {
      commentable->setComment(comment->withAppendedParagraph(callout));
      return D;
    }
  }

  // Without documentation to extend, the callout becomes the documentation.
  return CommentableDecl::create(Comment::getDoc(callout), std::move(D));
}
