#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::app::query {

enum class TokKind { LParen, RParen, Word, Op, And, Or, End };

struct Token {
  TokKind kind{TokKind::End};
  std::string text;    // unquoted word text or operator symbol
  size_t pos{0};       // byte offset of the first character
  bool quoted{false};  // word came from "..." or '...'
};

// Split a filter string. Fails only on an unterminated quote.
bool tokenize(std::string_view text, std::vector<Token>& out, size_t& err_pos, std::string& err_reason);

} // namespace vigil::app::query
