#include "app/QueryLexer.hpp"

#include <cctype>
#include "util/AsciiLower.hpp"

namespace vigil::app::query {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Comparison operator at text[i]; `len` receives its byte length.
static bool op_at(std::string_view text, size_t i, size_t& len) {
  char c = text[i];
  char n = i + 1 < text.size() ? text[i + 1] : '\0';
  if ((c == '>' || c == '<' || c == '!' || c == '=') && n == '=') { len = 2; return true; }
  if (c == '>' || c == '<' || c == '=') { len = 1; return true; }
  return false;
}

static bool logic_at(std::string_view text, size_t i) {
  if (i + 1 >= text.size()) return false;
  return (text[i] == '&' && text[i + 1] == '&') || (text[i] == '|' && text[i + 1] == '|');
}

// A single quote only opens a string at the start of a word ("o'reilly").
static bool ends_word(std::string_view text, size_t i) {
  char c = text[i];
  size_t len = 0;
  return is_space(c) || c == '(' || c == ')' || c == '"' ||
         op_at(text, i, len) || logic_at(text, i);
}

bool tokenize(std::string_view text, std::vector<Token>& out, size_t& err_pos, std::string& err_reason) {
  out.clear();
  size_t i = 0;
  const size_t n = text.size();
  while (i < n) {
    char c = text[i];
    if (is_space(c)) { ++i; continue; }
    if (c == '(') { out.push_back({TokKind::LParen, "(", i, false}); ++i; continue; }
    if (c == ')') { out.push_back({TokKind::RParen, ")", i, false}); ++i; continue; }
    if (logic_at(text, i)) {
      out.push_back({c == '&' ? TokKind::And : TokKind::Or, std::string(text.substr(i, 2)), i, false});
      i += 2;
      continue;
    }
    size_t oplen = 0;
    if (op_at(text, i, oplen)) {
      std::string sym(text.substr(i, oplen));
      if (sym == "==") sym = "=";
      out.push_back({TokKind::Op, sym, i, false});
      i += oplen;
      continue;
    }
    if (c == '"' || c == '\'') {
      const char quote = c;
      const size_t start = i++;
      std::string word;
      bool closed = false;
      while (i < n) {
        if (text[i] == '\\' && i + 1 < n && (text[i + 1] == quote || text[i + 1] == '\\')) {
          word.push_back(text[i + 1]);
          i += 2;
          continue;
        }
        if (text[i] == quote) { closed = true; ++i; break; }
        word.push_back(text[i++]);
      }
      if (!closed) {
        err_pos = start;
        err_reason = "unterminated quoted string";
        return false;
      }
      out.push_back({TokKind::Word, std::move(word), start, true});
      continue;
    }
    const size_t start = i;
    while (i < n && !ends_word(text, i)) ++i;
    std::string word(text.substr(start, i - start));
    TokKind kind = TokKind::Word;
    if (vigil::util::ascii_iequals(word, "and")) kind = TokKind::And;
    else if (vigil::util::ascii_iequals(word, "or")) kind = TokKind::Or;
    out.push_back({kind, std::move(word), start, false});
  }
  out.push_back({TokKind::End, "", n, false});
  return true;
}

} // namespace vigil::app::query
