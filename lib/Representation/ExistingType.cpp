//===--- ExistingType.cpp - References to existing types ------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/ExistingType.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <cassert>

using namespace sfsymbols;

ExistingType ExistingType::wrapping(Kind kind, ExistingType wrapped) {
  ExistingType type(kind);
  type.Children.push_back(std::move(wrapped));
  return type;
}

ExistingType ExistingType::getMember(ArrayRef<StringRef> components) {
  assert(!components.empty() && "type must have a name");
  ExistingType type(Kind::Member);
  for (StringRef component : components)
    type.Components.push_back(component.str());
  return type;
}

ExistingType ExistingType::getNamed(StringRef name) {
  SmallVector<StringRef, 2> components;
  name.split(components, '.');
  return getMember(components);
}

ExistingType ExistingType::getGeneric(ExistingType wrapper,
                                      ExistingType wrapped) {
  ExistingType type(Kind::Generic);
  type.Children.push_back(std::move(wrapper));
  type.Children.push_back(std::move(wrapped));
  return type;
}

void ExistingType::print(raw_ostream &OS) const {
  switch (TheKind) {
  case Kind::Member: {
    bool first = true;
    for (const auto &component : Components) {
      if (!first)
        OS << '.';
      first = false;
      OS << component;
    }
    return;
  }
  case Kind::Any:
    OS << "any ";
    Children[0].print(OS);
    return;
  case Kind::Optional:
    Children[0].print(OS);
    OS << '?';
    return;
  case Kind::Array:
    OS << '[';
    Children[0].print(OS);
    OS << ']';
    return;
  case Kind::DictionaryValue:
    OS << "[String: ";
    Children[0].print(OS);
    OS << ']';
    return;
  case Kind::Generic:
    Children[0].print(OS);
    OS << '<';
    Children[1].print(OS);
    OS << '>';
    return;
  }
  llvm_unreachable("bad ExistingType kind");
}

std::string ExistingType::getString() const {
  std::string result;
  llvm::raw_string_ostream OS(result);
  print(OS);
  return OS.str();
}
