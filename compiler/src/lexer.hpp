#ifndef ELI_LEXER_HPP
#define ELI_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace eli {

enum class TokenKind {
  // Fixed punctuation. '{' lexes to RCurly and '(' to RParen.
  RParen,
  LParen,
  RCurly,
  LCurly,
  Colon,
  Semicolon,
  Comma,
  Equals,
  Exclamation,
  Function,
  Return,
  Operator,  // + - * /
  Ident,
  Float,
  Int,
};

struct Token {
  TokenKind kind = TokenKind::Int;
  char op = 0;            // for Operator
  std::string ident;      // for Ident (owned copy of the source text)
  double float_value = 0.0;
  int64_t int_value = 0;
};

/* A token together with the cursor position right after it was scanned. */
struct PositionedToken {
  Token token;
  size_t line = 0;
  size_t column = 0;
};

enum class LexErrorKind {
  NumericLiteral,
  IdentifierRejected,
};

struct LexError {
  LexErrorKind kind = LexErrorKind::NumericLiteral;
  std::string message;
  size_t line = 0;
  size_t column = 0;
};

struct LexResult {
  std::optional<PositionedToken> token;  // empty at end of input
  std::optional<LexError> error;
  bool ok() const { return !error.has_value(); }
  bool at_end() const { return ok() && !token.has_value(); }
};

/* Returns true if the scanned identifier text is acceptable. Keywords never reach it. */
using IdentifierValidator = std::function<bool(const std::string&)>;

/* The ELi linter rule: identifiers must not contain a lowercase 'l'. */
bool reject_lowercase_l(const std::string& ident);

class Lexer {
 public:
  explicit Lexer(std::string source, IdentifierValidator validator = reject_lowercase_l);

  /* Scans the next token. Keeps returning end once the input is exhausted. */
  LexResult lex();

  size_t line() const { return line_; }
  size_t column() const { return column_; }

 private:
  bool at_eof() const { return offset_ >= source_.size(); }
  char peek() const { return source_[offset_]; }
  /* Columns count characters: UTF-8 continuation bytes do not advance them. */
  void bump() {
    if ((static_cast<unsigned char>(source_[offset_]) & 0xC0) != 0x80) ++column_;
    ++offset_;
  }
  LexResult fail(LexErrorKind kind, std::string message) const;
  /* Scans digits and dots from the cursor; `start` is where the literal text begins. */
  bool lex_numeric(size_t start, Token* out, std::string* err);

  std::string source_;
  IdentifierValidator validator_;
  size_t offset_ = 0;
  size_t line_ = 0;
  size_t column_ = 0;
};

using ErrorHandler = std::function<void(const LexError&)>;

/** Single-pass view over a Lexer's tokens. Ends at end of input or at the first error;
 *  the error is kept on the stream and passed to the handler, if one was given. */
class TokenStream {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = PositionedToken;
    using difference_type = std::ptrdiff_t;
    using pointer = const PositionedToken*;
    using reference = const PositionedToken&;

    iterator() = default;
    explicit iterator(TokenStream* stream) : stream_(stream) {}

    reference operator*() const { return *stream_->current_; }
    pointer operator->() const { return &*stream_->current_; }
    iterator& operator++() {
      if (!stream_->advance()) stream_ = nullptr;
      return *this;
    }
    void operator++(int) { ++*this; }
    bool operator==(const iterator& other) const { return stream_ == other.stream_; }
    bool operator!=(const iterator& other) const { return stream_ != other.stream_; }

   private:
    TokenStream* stream_ = nullptr;
  };

  explicit TokenStream(Lexer& lexer, ErrorHandler on_error = nullptr);

  iterator begin();
  iterator end() { return iterator(); }

  bool failed() const { return error_.has_value(); }
  const std::optional<LexError>& error() const { return error_; }

 private:
  bool advance();

  Lexer& lexer_;
  ErrorHandler on_error_;
  std::optional<PositionedToken> current_;
  std::optional<LexError> error_;
  bool started_ = false;
  bool done_ = false;
};

struct LexAllResult {
  std::vector<PositionedToken> tokens;
  std::optional<LexError> error;
  bool ok() const { return !error.has_value(); }
};

/* Lexes the whole source with the default identifier rule. */
LexAllResult lex_all(const std::string& source);

const char* token_kind_name(TokenKind kind);
std::string format_token(const Token& token);

}  // namespace eli

#endif
