#include "filter_parser.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "filter_fields.hpp"
#include "internal/db/sqlite/search_function.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::filter {
namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// where a bare ~code may end
bool IsFlagBoundary(char c) {
  return IsSpace(c) || c == '(' || c == ')' || c == '!' || c == '&' || c == '|';
}

bool EndsWord(char c) {
  return IsSpace(c) || c == '(' || c == ')' || c == '~' || c == '\'' || c == '"';
}

bool StartsOperator(char c) {
  return c == '(' || c == ')' || c == '~' || c == '!' || c == '&' || c == '|';
}

class Parser {
 public:
  explicit Parser(std::string_view text) : text_(text) {}

  FilterNodePtr Run() {
    SkipSpace();
    if (AtEnd()) {
      Fail("empty filter expression");
    }

    auto node = ParseOr();

    SkipSpace();
    if (!AtEnd()) {
      if (Peek() == ')') Fail("unbalanced parentheses: unexpected ')'");
      Fail(std::string("unexpected '") + Peek() + "'");
    }
    return node;
  }

 private:
  // ------------------------------------------------------------
  // Operators
  // ------------------------------------------------------------

  FilterNodePtr ParseOr() {
    std::vector<FilterNodePtr> children{ParseAnd()};
    while (true) {
      SkipSpace();
      if (AtEnd() || Peek() != '|') break;
      ++pos_;
      children.push_back(ParseAnd());
    }
    return children.size() == 1 ? children.front() : MakeOr(std::move(children));
  }

  FilterNodePtr ParseAnd() {
    std::vector<FilterNodePtr> children{ParseNot()};
    while (true) {
      SkipSpace();
      if (AtEnd() || Peek() == ')' || Peek() == '|') break;
      if (Peek() == '&') ++pos_;
      children.push_back(ParseNot());
    }
    return children.size() == 1 ? children.front() : MakeAnd(std::move(children));
  }

  FilterNodePtr ParseNot() {
    SkipSpace();
    if (!AtEnd() && Peek() == '!') {
      ++pos_;
      return MakeNot(ParseNot());
    }
    return ParsePrimary();
  }

  FilterNodePtr ParsePrimary() {
    SkipSpace();
    if (AtEnd()) {
      Fail("missing operand at end of expression");
    }

    const char c = Peek();
    if (c == '(') {
      const std::size_t open = pos_++;
      auto node = ParseOr();
      SkipSpace();
      if (AtEnd() || Peek() != ')') {
        Fail("unbalanced parentheses: '(' at position " + std::to_string(open) + " is never closed");
      }
      ++pos_;
      return node;
    }
    if (c == ')') {
      Fail("unbalanced parentheses: unexpected ')'");
    }
    if (c == '&' || c == '|') {
      Fail(std::string("missing operand before '") + c + "'");
    }
    if (c == '~') {
      return ParseFlag();
    }

    auto pattern = ReadArgument();
    if (!pattern) {
      Fail("expected a filter expression");
    }
    return MakeRegex("u", CheckedRegex(*pattern));
  }

  // ------------------------------------------------------------
  // Atoms
  // ------------------------------------------------------------

  FilterNodePtr ParseFlag() {
    const std::size_t start = pos_++;
    const std::string_view rest = text_.substr(pos_);

    const FieldSpec* field = nullptr;
    for (auto code : CodesLongestFirst()) {
      if (rest.substr(0, code.size()) == code && (rest.size() == code.size() || IsFlagBoundary(rest[code.size()]))) {
        field = FindField(code);
        break;
      }
    }
    if (!field) {
      std::size_t end = pos_;
      while (end < text_.size() && !IsFlagBoundary(text_[end])) ++end;
      pos_ = start;
      Fail("unknown filter flag '~" + std::string(text_.substr(start + 1, end - start - 1)) + "'");
    }
    pos_ += field->code.size();

    const std::string code(field->code);
    switch (field->kind) {
      case FieldKind::kUnary:
        return MakeUnary(code);

      case FieldKind::kRegex: {
        auto pattern = ReadArgument();
        if (!pattern) Fail("missing argument for '~" + code + "'");
        return MakeRegex(code, CheckedRegex(*pattern));
      }

      case FieldKind::kInt: {
        SkipSpace();
        if (AtEnd() || StartsOperator(Peek())) Fail("missing argument for '~" + code + "'");

        // digits only, so "~c 200|~c 201" splits at the operator
        const std::size_t arg_start = pos_;
        std::size_t       end       = pos_;
        while (end < text_.size() && text_[end] >= '0' && text_[end] <= '9') ++end;

        std::int64_t value = 0;
        const char*  first = text_.data() + arg_start;
        const char*  last  = text_.data() + end;
        auto [ptr, ec]     = std::from_chars(first, last, value);
        if (end == arg_start || ec != std::errc() || ptr != last ||
            (end < text_.size() && !IsFlagBoundary(text_[end]))) {
          std::size_t word_end = end;
          while (word_end < text_.size() && !EndsWord(text_[word_end])) ++word_end;
          pos_ = arg_start;
          Fail("'~" + code + "' expects an integer, got '" + std::string(text_.substr(arg_start, word_end - arg_start)) +
               "'");
        }
        pos_ = end;
        return MakeInt(code, value);
      }
    }
    Fail("unhandled field kind for '~" + code + "'");
  }

  // Quoted string or bare word; nullopt when the next token is an
  // operator or the input ends.
  std::optional<std::string> ReadArgument() {
    SkipSpace();
    if (AtEnd() || StartsOperator(Peek())) {
      return std::nullopt;
    }
    if (Peek() == '\'' || Peek() == '"') {
      return ReadQuoted();
    }

    const std::size_t start = pos_;
    while (!AtEnd() && !EndsWord(Peek())) ++pos_;
    return std::string(text_.substr(start, pos_ - start));
  }

  std::string ReadQuoted() {
    const std::size_t start = pos_;
    const char quote        = text_[pos_++];

    std::string out;
    while (true) {
      if (AtEnd()) {
        pos_ = start;
        Fail("unterminated quoted string");
      }
      char c = text_[pos_++];
      if (c == quote) break;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (AtEnd()) {
        pos_ = start;
        Fail("unterminated quoted string");
      }
      c = text_[pos_++];
      switch (c) {
        case 'n':
          out += '\n';
          break;
        case 't':
          out += '\t';
          break;
        case 'r':
          out += '\r';
          break;
        case 'f':
          out += '\f';
          break;
        default:
          out += c;
      }
    }
    return out;
  }

  std::string CheckedRegex(std::string pattern) {
    auto error = db::sqlite::PatternError(pattern);
    if (!error.empty()) {
      Fail("invalid regular expression '" + pattern + "': " + error);
    }
    return pattern;
  }

  // ------------------------------------------------------------
  // Scanning
  // ------------------------------------------------------------

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  char Peek() const {
    return text_[pos_];
  }

  void SkipSpace() {
    while (!AtEnd() && IsSpace(Peek())) ++pos_;
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw util::ParseError(what + " at position " + std::to_string(pos_));
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

} // namespace

FilterNodePtr Parse(std::string_view text) {
  return Parser(text).Run();
}

} // namespace flowstore::filter
