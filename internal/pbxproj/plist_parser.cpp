#include "plist_parser.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace pbxpatch::pbxproj {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsDelimiter(char c) {
  switch (c) {
    case '{':
    case '}':
    case '(':
    case ')':
    case '=':
    case ';':
    case ',':
    case '"':
      return true;
    default:
      return IsSpace(c);
  }
}

std::string Trim(std::string_view value) {
  auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

const char* Describe(TokenType type) {
  switch (type) {
    case TokenType::kString:
      return "string";
    case TokenType::kOpenBrace:
      return "'{'";
    case TokenType::kCloseBrace:
      return "'}'";
    case TokenType::kOpenParen:
      return "'('";
    case TokenType::kCloseParen:
      return "')'";
    case TokenType::kEquals:
      return "'='";
    case TokenType::kSemicolon:
      return "';'";
    case TokenType::kComma:
      return "','";
    case TokenType::kEnd:
    default:
      return "end of section";
  }
}

} // namespace

std::size_t LineStart(std::string_view text, std::size_t offset) {
  if (offset == 0) return 0;
  offset        = std::min(offset, text.size());
  auto newline  = text.rfind('\n', offset - 1);
  return newline == std::string_view::npos ? 0 : newline + 1;
}

std::size_t LineNumber(std::string_view text, std::size_t offset) {
  offset = std::min(offset, text.size());
  return 1 + static_cast<std::size_t>(std::count(text.begin(), text.begin() + offset, '\n'));
}

// ------------------------------------------------------------
// Lexer
// ------------------------------------------------------------

PlistLexer::PlistLexer(std::string_view text, std::size_t begin, std::size_t end)
    : text_(text), pos_(begin), end_(std::min(end, text.size())) {
}

void PlistLexer::Fail(std::size_t offset, const std::string& what) const {
  throw util::MalformedDescriptor("line " + std::to_string(LineNumber(text_, offset)) + ": " + what);
}

void PlistLexer::SkipTrivia() {
  while (pos_ < end_) {
    const char c = text_[pos_];
    if (IsSpace(c)) {
      ++pos_;
      continue;
    }

    if (c == '/' && pos_ + 1 < end_ && text_[pos_ + 1] == '*') {
      const auto close = text_.find("*/", pos_ + 2);
      if (close == std::string_view::npos || close + 2 > end_) Fail(pos_, "unterminated comment");
      last_comment_ = Trim(text_.substr(pos_ + 2, close - pos_ - 2));
      pos_          = close + 2;
      continue;
    }

    if (c == '/' && pos_ + 1 < end_ && text_[pos_ + 1] == '/') {
      const auto newline = text_.find('\n', pos_);
      pos_               = newline == std::string_view::npos ? end_ : std::min(newline + 1, end_);
      continue;
    }

    return;
  }
}

Token PlistLexer::Next() {
  last_comment_.clear();
  SkipTrivia();

  Token token;
  token.begin = pos_;
  if (pos_ >= end_) {
    token.type = TokenType::kEnd;
    token.end  = pos_;
    return token;
  }

  switch (text_[pos_]) {
    case '{':
      token.type = TokenType::kOpenBrace;
      break;
    case '}':
      token.type = TokenType::kCloseBrace;
      break;
    case '(':
      token.type = TokenType::kOpenParen;
      break;
    case ')':
      token.type = TokenType::kCloseParen;
      break;
    case '=':
      token.type = TokenType::kEquals;
      break;
    case ';':
      token.type = TokenType::kSemicolon;
      break;
    case ',':
      token.type = TokenType::kComma;
      break;
    case '"':
      return ReadQuoted();
    default:
      return ReadBare();
  }

  token.end = ++pos_;
  return token;
}

Token PlistLexer::ReadQuoted() {
  Token token;
  token.type  = TokenType::kString;
  token.begin = pos_;

  ++pos_; // opening quote
  while (pos_ < end_) {
    const char c = text_[pos_++];
    if (c == '"') {
      token.end = pos_;
      return token;
    }
    if (c != '\\') {
      token.text.push_back(c);
      continue;
    }

    if (pos_ >= end_) break;
    const char escaped = text_[pos_++];
    switch (escaped) {
      case 'n':
        token.text.push_back('\n');
        break;
      case 't':
        token.text.push_back('\t');
        break;
      case 'r':
        token.text.push_back('\r');
        break;
      default:
        token.text.push_back(escaped);
        break;
    }
  }

  Fail(token.begin, "unterminated string");
}

Token PlistLexer::ReadBare() {
  Token token;
  token.type  = TokenType::kString;
  token.begin = pos_;

  while (pos_ < end_) {
    const char c = text_[pos_];
    if (IsDelimiter(c)) break;
    if (c == '/' && pos_ + 1 < end_ && (text_[pos_ + 1] == '*' || text_[pos_ + 1] == '/')) break;
    token.text.push_back(c);
    ++pos_;
  }

  if (token.text.empty()) Fail(token.begin, std::string("unexpected character '") + text_[token.begin] + "'");
  token.end = pos_;
  return token;
}

// ------------------------------------------------------------
// Values
// ------------------------------------------------------------

const PlistValue* PlistValue::Find(std::string_view key) const {
  for (const auto& field : fields) {
    if (field.key == key) return &field.value;
  }
  return nullptr;
}

std::string PlistValue::StringOr(std::string_view key, const std::string& fallback) const {
  const auto* value = Find(key);
  if (!value || value->kind != Kind::kString) return fallback;
  return value->string;
}

// ------------------------------------------------------------
// Parser
// ------------------------------------------------------------

PlistParser::PlistParser(PlistLexer lexer) : lexer_(std::move(lexer)) {
}

Token PlistParser::Expect(TokenType type, const char* what) {
  auto token = lexer_.Next();
  if (token.type != type) {
    lexer_.Fail(token.begin, std::string("expected ") + Describe(type) + " " + what + ", found " + Describe(token.type));
  }
  return token;
}

std::optional<PlistObject> PlistParser::NextObject() {
  auto id = lexer_.Next();
  if (id.type == TokenType::kEnd) return std::nullopt;
  if (id.type != TokenType::kString) lexer_.Fail(id.begin, std::string("expected object id, found ") + Describe(id.type));

  PlistObject object;
  object.id    = id.text;
  object.begin = id.begin;

  Expect(TokenType::kEquals, "after object id");
  object.comment = lexer_.LastComment();

  auto open = lexer_.Next();
  if (open.type != TokenType::kOpenBrace) lexer_.Fail(open.begin, "object " + object.id + " is not a dictionary");
  object.body = ParseValue(open);

  object.end = Expect(TokenType::kSemicolon, "after object").end;
  return object;
}

PlistValue PlistParser::ParseValue(const Token& first) {
  PlistValue value;
  value.begin = first.begin;

  switch (first.type) {
    case TokenType::kString:
      value.kind   = PlistValue::Kind::kString;
      value.string = first.text;
      value.end    = first.end;
      return value;

    case TokenType::kOpenBrace: {
      value.kind = PlistValue::Kind::kDict;
      while (true) {
        auto key = lexer_.Next();
        if (key.type == TokenType::kCloseBrace) {
          value.end = key.begin;
          return value;
        }
        if (key.type != TokenType::kString) lexer_.Fail(key.begin, std::string("expected key, found ") + Describe(key.type));

        Expect(TokenType::kEquals, "after key");
        PlistField field;
        field.key   = key.text;
        field.value = ParseValue(lexer_.Next());
        Expect(TokenType::kSemicolon, ("after value of " + key.text).c_str());
        value.fields.push_back(std::move(field));
      }
    }

    case TokenType::kOpenParen: {
      value.kind = PlistValue::Kind::kArray;
      auto token = lexer_.Next();
      while (true) {
        if (token.type == TokenType::kCloseParen) {
          value.end = token.begin;
          return value;
        }
        value.items.push_back(ParseValue(token));

        token = lexer_.Next();
        if (token.type == TokenType::kComma) {
          token = lexer_.Next();
        } else if (token.type != TokenType::kCloseParen) {
          lexer_.Fail(token.begin, std::string("expected ',' or ')', found ") + Describe(token.type));
        }
      }
    }

    default:
      lexer_.Fail(first.begin, std::string("unexpected ") + Describe(first.type));
  }
}

} // namespace pbxpatch::pbxproj
