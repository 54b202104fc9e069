#include "sandbox_lexer.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>

#include "tether/sandbox.hpp"

namespace tether::sandbox {

namespace {

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

// Longest first
constexpr std::array<std::string_view, 20> multi_char_ops{
  "**=", "//=", "...", "==", "!=", "<=", ">=", "+=", "-=", "*=",
  "/=",  "%=",  "**",  "//", "->", ":=", "&=", "|=", "<<", ">>"};

constexpr std::string_view single_char_ops{"+-*/%<>=()[]{},:.;@&|^~!"};

void append_utf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

class lexer {
 public:
  explicit lexer(std::string_view src) : src_{src} {}

  std::vector<token> run() {
    while (pos_ < src_.size()) {
      if (at_line_start_ && depth_ == 0) {
        if (!handle_indentation()) continue;
      }
      lex_one();
    }
    if (!tokens_.empty() && tokens_.back().kind != token_kind::newline &&
        tokens_.back().kind != token_kind::dedent)
      push(token_kind::newline, "");
    while (indents_.size() > 1) {
      indents_.pop_back();
      push(token_kind::dedent, "");
    }
    push(token_kind::end, "");
    return std::move(tokens_);
  }

 private:
  [[noreturn]] void fail(std::string_view what) const {
    throw syntax_error{line_, fmt::format("line {}: {}", line_, what)};
  }

  void push(token_kind kind, std::string text) {
    tokens_.push_back(token{kind, std::move(text), line_});
  }

  [[nodiscard]] char peek(std::size_t ahead = 0) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }

  /// Returns false when the line was blank and has been consumed.
  bool handle_indentation() {
    std::size_t width{0};
    std::size_t p{pos_};
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) {
      width = src_[p] == '\t' ? (width / 8 + 1) * 8 : width + 1;
      ++p;
    }
    // Blank and comment-only lines do not affect layout
    if (p >= src_.size() || src_[p] == '\n' || src_[p] == '\r' ||
        src_[p] == '#') {
      while (p < src_.size() && src_[p] != '\n') ++p;
      if (p < src_.size()) {
        ++p;
        ++line_;
      }
      pos_ = p;
      return false;
    }
    pos_ = p;
    at_line_start_ = false;

    if (width > indents_.back()) {
      indents_.push_back(width);
      push(token_kind::indent, "");
    } else {
      while (width < indents_.back()) {
        indents_.pop_back();
        push(token_kind::dedent, "");
      }
      if (width != indents_.back())
        fail("unindent does not match any outer indentation level");
    }
    return true;
  }

  void lex_one() {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
      ++pos_;
      return;
    }
    if (c == '#') {
      while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
      return;
    }
    if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
      pos_ += peek(1) == '\n' ? 2 : 3;
      ++line_;
      return;
    }
    if (c == '\n') {
      ++pos_;
      if (depth_ == 0) {
        if (!tokens_.empty() && tokens_.back().kind != token_kind::newline &&
            tokens_.back().kind != token_kind::indent &&
            tokens_.back().kind != token_kind::dedent)
          push(token_kind::newline, "");
        at_line_start_ = true;
      }
      ++line_;
      return;
    }
    if (is_ident_start(c)) {
      lex_name_or_prefixed_string();
      return;
    }
    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
      lex_number();
      return;
    }
    if (c == '"' || c == '\'') {
      lex_string(false, false);
      return;
    }
    for (auto op : multi_char_ops) {
      if (src_.substr(pos_, op.size()) == op) {
        push(token_kind::op, std::string{op});
        pos_ += op.size();
        return;
      }
    }
    if (single_char_ops.find(c) != std::string_view::npos) {
      if (c == '(' || c == '[' || c == '{') ++depth_;
      if (c == ')' || c == ']' || c == '}') {
        if (depth_ == 0) fail(fmt::format("unmatched '{}'", c));
        --depth_;
      }
      push(token_kind::op, std::string(1, c));
      ++pos_;
      return;
    }
    fail(fmt::format(
        "invalid character '{}' (0x{:02x})", c,
        static_cast<unsigned char>(c)));
  }

  void lex_name_or_prefixed_string() {
    std::size_t start{pos_};
    while (pos_ < src_.size() && is_ident_char(src_[pos_])) ++pos_;
    std::string word{src_.substr(start, pos_ - start)};

    char q = peek();
    if ((q == '"' || q == '\'') && word.size() <= 2) {
      bool is_f{false}, is_raw{false}, ok{true};
      for (char ch : word) {
        switch (std::tolower(static_cast<unsigned char>(ch))) {
          case 'f': is_f = true; break;
          case 'r': is_raw = true; break;
          case 'u': break;
          case 'b': fail("bytes literals are not supported");
          default: ok = false;
        }
      }
      if (ok) {
        lex_string(is_f, is_raw);
        return;
      }
    }
    push(token_kind::name, std::move(word));
  }

  void lex_number() {
    std::size_t start{pos_};
    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' ||
                          peek(1) == 'O' || peek(1) == 'b' || peek(1) == 'B')) {
      pos_ += 2;
      while (pos_ < src_.size() && (is_ident_char(src_[pos_]))) ++pos_;
    } else {
      while (pos_ < src_.size() && (is_digit(src_[pos_]) || src_[pos_] == '_'))
        ++pos_;
      if (peek() == '.' && peek(1) != '.') {
        ++pos_;
        while (pos_ < src_.size() && (is_digit(src_[pos_]) || src_[pos_] == '_'))
          ++pos_;
      }
      if (peek() == 'e' || peek() == 'E') {
        std::size_t save{pos_};
        ++pos_;
        if (peek() == '+' || peek() == '-') ++pos_;
        if (!is_digit(peek())) {
          pos_ = save;
        } else {
          while (pos_ < src_.size() && is_digit(src_[pos_])) ++pos_;
        }
      }
      if (peek() == 'j' || peek() == 'J') fail("complex numbers are not supported");
    }
    if (is_ident_start(peek())) fail("invalid number literal");
    push(token_kind::number, std::string{src_.substr(start, pos_ - start)});
  }

  void lex_string(bool is_f, bool is_raw) {
    char q = peek();
    bool triple = peek(1) == q && peek(2) == q;
    pos_ += triple ? 3 : 1;
    int start_line{line_};

    std::string out;
    for (;;) {
      if (pos_ >= src_.size()) {
        line_ = start_line;
        fail("unterminated string literal");
      }
      char c = src_[pos_];
      if (c == q) {
        if (!triple) {
          ++pos_;
          break;
        }
        if (peek(1) == q && peek(2) == q) {
          pos_ += 3;
          break;
        }
      }
      if (c == '\n') {
        if (!triple) {
          line_ = start_line;
          fail("unterminated string literal");
        }
        ++line_;
      }
      if (c == '\\' && pos_ + 1 < src_.size()) {
        char e = src_[pos_ + 1];
        if (is_raw) {
          out += c;
          out += e;
          if (e == '\n') ++line_;
          pos_ += 2;
          continue;
        }
        pos_ += 2;
        switch (e) {
          case 'n': out += '\n'; break;
          case 't': out += '\t'; break;
          case 'r': out += '\r'; break;
          case '0': out += '\0'; break;
          case '\\': out += '\\'; break;
          case '\'': out += '\''; break;
          case '"': out += '"'; break;
          case '\n': ++line_; break;
          case 'x':
          case 'u':
          case 'U': {
            std::size_t n = e == 'x' ? 2 : e == 'u' ? 4 : 8;
            if (pos_ + n > src_.size()) fail("truncated escape sequence");
            unsigned long cp{0};
            for (std::size_t i = 0; i < n; ++i) {
              char h = src_[pos_ + i];
              if (!std::isxdigit(static_cast<unsigned char>(h)))
                fail("invalid escape sequence");
              cp = cp * 16 + static_cast<unsigned long>(
                  std::isdigit(static_cast<unsigned char>(h))
                      ? h - '0'
                      : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
            }
            pos_ += n;
            append_utf8(out, cp);
            break;
          }
          default:
            out += '\\';
            out += e;
        }
        continue;
      }
      out += c;
      ++pos_;
    }
    tokens_.push_back(token{
      is_f ? token_kind::fstring : token_kind::string, std::move(out),
      start_line});
  }

  std::string_view src_;
  std::size_t pos_{0};
  int line_{1};
  int depth_{0};
  bool at_line_start_{true};
  std::vector<std::size_t> indents_{0};
  std::vector<token> tokens_;
};

}  // namespace

std::vector<token> tokenize(std::string_view source) {
  return lexer{source}.run();
}

}  // namespace tether::sandbox
