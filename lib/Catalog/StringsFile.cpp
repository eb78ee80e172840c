//===--- StringsFile.cpp - Old-style property list string tables ----------===//
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
// The parser accepts the subset of the OpenStep property list format used by
// string tables: a flat dictionary, optionally enclosed in braces, whose keys
// and values are quoted or unquoted strings. Tables converted to JSON with
// "plutil -convert json" and UTF-16 encoded files are accepted as well.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Catalog/StringsFile.h"
#include "sfsymbols/Basic/PrettyStackTrace.h"
#include "clang/Basic/CharInfo.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>

using namespace sfsymbols;

namespace {

/// Parses the text of an old-style string table.
class StringsParser {
  StringRef BufferName;
  const char *BufferStart;
  const char *CurPtr;
  const char *BufferEnd;

public:
  StringsParser(StringRef text, StringRef bufferName)
      : BufferName(bufferName), BufferStart(text.begin()),
        CurPtr(text.begin()), BufferEnd(text.end()) {}

  llvm::Error parse(StringsTable &table);

private:
  bool isAtEnd() const { return CurPtr == BufferEnd; }
  char peek() const { return isAtEnd() ? '\0' : *CurPtr; }

  static bool isUnquotedStringChar(char c) {
    return clang::isAlphanumeric(c) || c == '_' || c == '.' || c == '$' ||
           c == ':' || c == '/' || c == '-';
  }

  /// Builds an error pointing at \p loc.
  llvm::Error error(const char *loc, const Twine &message) const;
  llvm::Error error(const Twine &message) const {
    return error(CurPtr, message);
  }

  /// Skips whitespace and both comment styles.
  llvm::Error skipTrivia();

  llvm::Error parseString(std::string &result);
  llvm::Error parseQuotedString(std::string &result);
  llvm::Error parseEscape(std::string &result);
  unsigned lexHexDigits(unsigned maxDigits, unsigned &value);
};

} // end anonymous namespace

llvm::Error StringsParser::error(const char *loc, const Twine &message) const {
  unsigned line = 1, column = 1;
  for (const char *p = BufferStart; p != loc; ++p) {
    if (*p == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  return llvm::make_error<llvm::StringError>(
      BufferName + ":" + Twine(line) + ":" + Twine(column) + ": " + message,
      llvm::inconvertibleErrorCode());
}

llvm::Error StringsParser::skipTrivia() {
  while (!isAtEnd()) {
    if (clang::isWhitespace(*CurPtr)) {
      ++CurPtr;
      continue;
    }
    if (*CurPtr != '/' || CurPtr + 1 == BufferEnd)
      return llvm::Error::success();

    if (CurPtr[1] == '/') {
      // Line comment.
      while (!isAtEnd() && *CurPtr != '\n' && *CurPtr != '\r')
        ++CurPtr;
      continue;
    }
    if (CurPtr[1] == '*') {
      const char *commentStart = CurPtr;
      CurPtr += 2;
      while (true) {
        if (BufferEnd - CurPtr < 2) {
          CurPtr = BufferEnd;
          return error(commentStart, "unterminated '/*' comment");
        }
        if (CurPtr[0] == '*' && CurPtr[1] == '/') {
          CurPtr += 2;
          break;
        }
        ++CurPtr;
      }
      continue;
    }
    return llvm::Error::success();
  }
  return llvm::Error::success();
}

unsigned StringsParser::lexHexDigits(unsigned maxDigits, unsigned &value) {
  unsigned count = 0;
  value = 0;
  while (count != maxDigits && !isAtEnd() && clang::isHexDigit(*CurPtr)) {
    value = value * 16 + llvm::hexDigitValue(*CurPtr);
    ++CurPtr;
    ++count;
  }
  return count;
}

static void appendCodePoint(std::string &result, unsigned codePoint) {
  char buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
  char *end = buffer;
  if (!llvm::ConvertCodePointToUTF8(codePoint, end)) {
    // Lone surrogates and out of range values become U+FFFD.
    end = buffer;
    llvm::ConvertCodePointToUTF8(0xFFFD, end);
  }
  result.append(buffer, end);
}

llvm::Error StringsParser::parseEscape(std::string &result) {
  const char *escapeStart = CurPtr - 1;
  if (isAtEnd())
    return error(escapeStart, "unterminated escape sequence");

  char c = *CurPtr++;
  switch (c) {
  case 'a': result += '\a'; return llvm::Error::success();
  case 'b': result += '\b'; return llvm::Error::success();
  case 'f': result += '\f'; return llvm::Error::success();
  case 'n': result += '\n'; return llvm::Error::success();
  case 'r': result += '\r'; return llvm::Error::success();
  case 't': result += '\t'; return llvm::Error::success();
  case 'v': result += '\v'; return llvm::Error::success();
  case '0': case '1': case '2': case '3':
  case '4': case '5': case '6': case '7': {
    // Up to three octal digits.
    unsigned value = c - '0';
    for (unsigned i = 1; i != 3 && !isAtEnd(); ++i) {
      if (*CurPtr < '0' || *CurPtr > '7')
        break;
      value = value * 8 + (*CurPtr++ - '0');
    }
    appendCodePoint(result, value);
    return llvm::Error::success();
  }
  case 'U':
  case 'u': {
    unsigned value;
    if (lexHexDigits(4, value) == 0)
      return error(escapeStart, "expected hexadecimal digits after '\\U'");

    // Combine a UTF-16 surrogate pair written as two escapes.
    if (value >= 0xD800 && value <= 0xDBFF && BufferEnd - CurPtr >= 6 &&
        CurPtr[0] == '\\' && (CurPtr[1] == 'U' || CurPtr[1] == 'u')) {
      const char *savedPtr = CurPtr;
      CurPtr += 2;
      unsigned low;
      if (lexHexDigits(4, low) == 4 && low >= 0xDC00 && low <= 0xDFFF) {
        value = 0x10000 + ((value - 0xD800) << 10) + (low - 0xDC00);
      } else {
        CurPtr = savedPtr;
      }
    }
    appendCodePoint(result, value);
    return llvm::Error::success();
  }
  default:
    // '"', '\'', '\\' and any other character stand for themselves.
    result += c;
    return llvm::Error::success();
  }
}

llvm::Error StringsParser::parseQuotedString(std::string &result) {
  const char *stringStart = CurPtr;
  char quote = *CurPtr++;
  while (true) {
    if (isAtEnd())
      return error(stringStart, "unterminated string");
    char c = *CurPtr++;
    if (c == quote)
      return llvm::Error::success();
    if (c == '\\') {
      if (auto err = parseEscape(result))
        return err;
      continue;
    }
    result += c;
  }
}

llvm::Error StringsParser::parseString(std::string &result) {
  result.clear();
  if (isAtEnd())
    return error("expected string, found end of file");
  if (*CurPtr == '"' || *CurPtr == '\'')
    return parseQuotedString(result);
  if (!isUnquotedStringChar(*CurPtr))
    return error(Twine("unexpected character '") + Twine(*CurPtr) +
                 "', expected string");
  const char *start = CurPtr;
  while (!isAtEnd() && isUnquotedStringChar(*CurPtr))
    ++CurPtr;
  result.assign(start, CurPtr);
  return llvm::Error::success();
}

llvm::Error StringsParser::parse(StringsTable &table) {
  if (auto err = skipTrivia())
    return err;

  bool braced = peek() == '{';
  if (braced)
    ++CurPtr;

  std::string key, value;
  while (true) {
    if (auto err = skipTrivia())
      return err;
    if (isAtEnd()) {
      if (braced)
        return error("expected '}' at end of dictionary");
      break;
    }
    if (braced && *CurPtr == '}') {
      ++CurPtr;
      if (auto err = skipTrivia())
        return err;
      if (!isAtEnd())
        return error("unexpected text after '}'");
      break;
    }

    if (auto err = parseString(key))
      return err;
    if (auto err = skipTrivia())
      return err;

    if (peek() == '=') {
      ++CurPtr;
      if (auto err = skipTrivia())
        return err;
      if (auto err = parseString(value))
        return err;
      if (auto err = skipTrivia())
        return err;
    } else {
      // "key"; is shorthand for "key" = "key";
      value = key;
    }

    if (peek() != ';')
      return error("expected ';' after entry for '" + key + "'");
    ++CurPtr;

    table.set(key, value);
  }
  return llvm::Error::success();
}

/// Reads a table written as a JSON object of strings. Returns None if
/// \p text is not JSON, so the caller can fall back to the old-style
/// parser; braced old-style tables also start with '{'.
static std::optional<llvm::Expected<StringsTable>>
parseAsJSON(StringRef text, StringRef bufferName) {
  auto json = llvm::json::parse(text);
  if (!json) {
    llvm::consumeError(json.takeError());
    return std::nullopt;
  }

  auto *object = json->getAsObject();
  if (!object)
    return std::nullopt;

  StringsTable table;
  for (const auto &entry : *object) {
    auto value = entry.second.getAsString();
    if (!value) {
      return llvm::Expected<StringsTable>(llvm::make_error<llvm::StringError>(
          bufferName + ": value for '" + entry.first.str() +
              "' is not a string",
          llvm::inconvertibleErrorCode()));
    }
    table.set(entry.first.str(), *value);
  }
  return llvm::Expected<StringsTable>(std::move(table));
}

llvm::Expected<StringsTable> StringsTable::loadFromPath(StringRef path) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> bufferOrErr =
      llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr) {
    return llvm::make_error<llvm::StringError>(
        path + ": " + bufferOrErr.getError().message(),
        bufferOrErr.getError());
  }
  return loadFromBuffer(std::move(bufferOrErr.get()));
}

llvm::Expected<StringsTable>
StringsTable::loadFromBuffer(std::unique_ptr<llvm::MemoryBuffer> buffer) {
  PrettyStackTraceStringAction trace("parsing string table",
                                     buffer->getBufferIdentifier());
  return loadFromBuffer(buffer->getBuffer(), buffer->getBufferIdentifier());
}

llvm::Expected<StringsTable>
StringsTable::loadFromBuffer(StringRef data, StringRef bufferName) {
  if (data.startswith("bplist")) {
    return llvm::make_error<llvm::StringError>(
        bufferName + ": binary property lists are not supported; convert the "
                     "file with 'plutil -convert json'",
        llvm::inconvertibleErrorCode());
  }

  // UTF-16 tables carry a byte order mark.
  std::string converted;
  if (data.startswith("\xFF\xFE") || data.startswith("\xFE\xFF")) {
    if (!llvm::convertUTF16ToUTF8String(
            llvm::makeArrayRef(data.data(), data.size()), converted)) {
      return llvm::make_error<llvm::StringError>(
          bufferName + ": invalid UTF-16 text", llvm::inconvertibleErrorCode());
    }
    data = converted;
  }
  if (data.startswith("\xEF\xBB\xBF"))
    data = data.drop_front(3);

  if (data.ltrim().startswith("{")) {
    if (auto result = parseAsJSON(data, bufferName))
      return std::move(*result);
  }

  StringsTable table;
  StringsParser parser(data, bufferName);
  if (auto err = parser.parse(table))
    return std::move(err);
  return std::move(table);
}

std::optional<StringRef> StringsTable::lookup(StringRef key) const {
  auto found = Entries.find(key);
  if (found == Entries.end())
    return std::nullopt;
  return StringRef(found->getValue());
}

std::vector<StringRef> StringsTable::getSortedKeys() const {
  std::vector<StringRef> keys;
  keys.reserve(Entries.size());
  for (const auto &entry : Entries)
    keys.push_back(entry.getKey());
  std::sort(keys.begin(), keys.end());
  return keys;
}
