#include "lexer.hpp"
#include <cctype>
#include <algorithm>
#include <charconv>
#include <limits>
#include <locale>
#include <sstream>
#include <system_error>
#include <utility>

namespace eli {

static bool is_newline(char c) {
  return c == '\n' || c == '\r';
}

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || is_newline(c);
}

static bool is_numeric(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
}

static Token make_token(TokenKind kind) {
  Token t;
  t.kind = kind;
  return t;
}

static Token make_operator(char op) {
  Token t;
  t.kind = TokenKind::Operator;
  t.op = op;
  return t;
}

bool reject_lowercase_l(const std::string& ident) {
  return ident.find('l') == std::string::npos;
}

Lexer::Lexer(std::string source, IdentifierValidator validator)
    : source_(std::move(source)), validator_(std::move(validator)) {}

LexResult Lexer::fail(LexErrorKind kind, std::string message) const {
  LexResult r;
  LexError e;
  e.kind = kind;
  e.message = std::move(message);
  e.line = line_;
  e.column = column_;
  r.error = std::move(e);
  return r;
}

bool Lexer::lex_numeric(size_t start, Token* out, std::string* err) {
  while (!at_eof() && is_numeric(peek())) bump();
  std::string text = source_.substr(start, offset_ - start);

  if (text.find('.') != std::string::npos) {
    // Exactly one '.' and at least one digit; "3." and ".5" are accepted.
    if (std::count(text.begin(), text.end(), '.') != 1 || text.size() < 2) {
      *err = "invalid float literal '" + text + "'";
      return false;
    }
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    // The text is well formed, so a failed read can only be an overflow.
    if (in.fail()) value = std::numeric_limits<double>::infinity();
    out->kind = TokenKind::Float;
    out->float_value = value;
    return true;
  }

  if (text.empty()) {
    *err = "expected digits";
    return false;
  }
  int64_t value = 0;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec == std::errc::result_out_of_range) {
    *err = "integer literal '" + text + "' out of range";
    return false;
  }
  if (ec != std::errc() || ptr != last) {
    *err = "invalid integer literal '" + text + "'";
    return false;
  }
  out->kind = TokenKind::Int;
  out->int_value = value;
  return true;
}

LexResult Lexer::lex() {
  for (;;) {
    while (!at_eof() && is_space(peek())) {
      if (is_newline(peek())) line_++;
      bump();
    }
    if (at_eof()) return {};

    size_t start = offset_;
    char c = peek();
    bump();

    Token tok;
    switch (c) {
      case '{': tok = make_token(TokenKind::RCurly); break;
      case '}': tok = make_token(TokenKind::LCurly); break;
      case '(': tok = make_token(TokenKind::RParen); break;
      case ')': tok = make_token(TokenKind::LParen); break;
      case ':': tok = make_token(TokenKind::Colon); break;
      case ';': tok = make_token(TokenKind::Semicolon); break;
      case ',': tok = make_token(TokenKind::Comma); break;
      case '=': tok = make_token(TokenKind::Equals); break;
      case '!': tok = make_token(TokenKind::Exclamation); break;

      case '0': case '1': case '2': case '3': case '4':
      case '5': case '6': case '7': case '8': case '9': {
        std::string err;
        if (!lex_numeric(start, &tok, &err))
          return fail(LexErrorKind::NumericLiteral, std::move(err));
        break;
      }

      case '-': {
        // A minus directly followed by a number is a signed literal; otherwise it is
        // the operator and the cursor is put back right after the '-'.
        size_t saved_offset = offset_;
        size_t saved_column = column_;
        std::string err;
        if (lex_numeric(offset_, &tok, &err)) {
          if (tok.kind == TokenKind::Float)
            tok.float_value = -tok.float_value;
          else
            tok.int_value = -tok.int_value;
        } else {
          offset_ = saved_offset;
          column_ = saved_column;
          tok = make_operator('-');
        }
        break;
      }

      case '+': tok = make_operator('+'); break;
      case '*': tok = make_operator('*'); break;
      case '/':
        if (!at_eof() && peek() == '/') {
          while (!at_eof() && !is_newline(peek())) bump();
          continue;
        }
        tok = make_operator('/');
        break;

      default: {
        while (!at_eof() && !is_space(peek())) bump();
        std::string text = source_.substr(start, offset_ - start);
        if (text == "function") {
          tok = make_token(TokenKind::Function);
        } else if (text == "return") {
          tok = make_token(TokenKind::Return);
        } else {
          if (validator_ && !validator_(text))
            return fail(LexErrorKind::IdentifierRejected, "'l' faiLs the ELi Linter");
          tok = make_token(TokenKind::Ident);
          tok.ident = std::move(text);
        }
        break;
      }
    }

    LexResult r;
    r.token = PositionedToken{std::move(tok), line_, column_};
    return r;
  }
}

TokenStream::TokenStream(Lexer& lexer, ErrorHandler on_error)
    : lexer_(lexer), on_error_(std::move(on_error)) {}

TokenStream::iterator TokenStream::begin() {
  if (!started_) {
    started_ = true;
    advance();
  }
  if (done_) return end();
  return iterator(this);
}

bool TokenStream::advance() {
  if (done_) return false;
  LexResult r = lexer_.lex();
  if (!r.ok()) {
    error_ = std::move(r.error);
    if (on_error_) on_error_(*error_);
  }
  if (!r.token) {
    current_.reset();
    done_ = true;
    return false;
  }
  current_ = std::move(r.token);
  return true;
}

LexAllResult lex_all(const std::string& source) {
  LexAllResult result;
  Lexer lexer(source);
  for (;;) {
    LexResult r = lexer.lex();
    if (!r.ok()) {
      result.error = std::move(r.error);
      break;
    }
    if (!r.token) break;
    result.tokens.push_back(std::move(*r.token));
  }
  return result;
}

const char* token_kind_name(TokenKind kind) {
  switch (kind) {
    case TokenKind::RParen: return "RParen";
    case TokenKind::LParen: return "LParen";
    case TokenKind::RCurly: return "RCurly";
    case TokenKind::LCurly: return "LCurly";
    case TokenKind::Colon: return "Colon";
    case TokenKind::Semicolon: return "Semicolon";
    case TokenKind::Comma: return "Comma";
    case TokenKind::Equals: return "Equals";
    case TokenKind::Exclamation: return "Exclamation";
    case TokenKind::Function: return "Function";
    case TokenKind::Return: return "Return";
    case TokenKind::Operator: return "Operator";
    case TokenKind::Ident: return "Ident";
    case TokenKind::Float: return "Float";
    case TokenKind::Int: return "Int";
  }
  return "?";
}

std::string format_token(const Token& token) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << token_kind_name(token.kind);
  switch (token.kind) {
    case TokenKind::Operator: out << "('" << token.op << "')"; break;
    case TokenKind::Ident: out << "(" << token.ident << ")"; break;
    case TokenKind::Float: out << "(" << token.float_value << ")"; break;
    case TokenKind::Int: out << "(" << token.int_value << ")"; break;
    default: break;
  }
  return out.str();
}

}  // namespace eli
