#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pbxpatch::pbxproj {

enum class TokenType {
  kString,
  kOpenBrace,
  kCloseBrace,
  kOpenParen,
  kCloseParen,
  kEquals,
  kSemicolon,
  kComma,
  kEnd,
};

struct Token {
  TokenType   type = TokenType::kEnd;
  std::string text; // unescaped, kString only
  std::size_t begin = 0;
  std::size_t end   = 0;
};

/*
  Tokenizer for the old-style (OpenStep) property list syntax of
  project.pbxproj.

  Works on a [begin, end) window of the full text so token offsets are
  absolute. Comments are skipped; the body of the most recent one is kept
  so callers can read the display name Xcode writes after an object id.
*/
class PlistLexer {
 public:
  PlistLexer(std::string_view text, std::size_t begin, std::size_t end);

  Token Next();

  // Comment skipped by the last Next() call, empty if none.
  const std::string& LastComment() const {
    return last_comment_;
  }

  [[noreturn]] void Fail(std::size_t offset, const std::string& what) const;

 private:
  void  SkipTrivia();
  Token ReadQuoted();
  Token ReadBare();

  std::string_view text_;
  std::size_t      pos_;
  std::size_t      end_;
  std::string      last_comment_;
};

struct PlistField;

struct PlistValue {
  enum class Kind { kString, kArray, kDict };

  Kind                    kind = Kind::kString;
  std::string             string;
  std::vector<PlistValue> items;
  std::vector<PlistField> fields;

  std::size_t begin = 0;
  // Arrays and dicts: offset of the closing bracket.
  std::size_t end = 0;

  const PlistValue* Find(std::string_view key) const;
  std::string       StringOr(std::string_view key, const std::string& fallback = {}) const;
};

struct PlistField {
  std::string key;
  PlistValue  value;
};

// One "ID /* comment */ = { ... };" entry of the objects table.
struct PlistObject {
  std::string id;
  std::string comment;
  PlistValue  body;
  std::size_t begin = 0;
  std::size_t end   = 0; // one past the trailing ';'
};

class PlistParser {
 public:
  explicit PlistParser(PlistLexer lexer);

  // Next object entry, or nullopt at the end of the window.
  std::optional<PlistObject> NextObject();

 private:
  PlistValue ParseValue(const Token& first);
  Token      Expect(TokenType type, const char* what);

  PlistLexer lexer_;
};

// Offset of the first byte of the line containing `offset`.
std::size_t LineStart(std::string_view text, std::size_t offset);

// 1-based line number of `offset`.
std::size_t LineNumber(std::string_view text, std::size_t offset);

} // namespace pbxpatch::pbxproj
