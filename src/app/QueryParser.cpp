#include "app/Query.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <vector>
#include "app/QueryLexer.hpp"
#include "util/AsciiLower.hpp"
#include "util/Units.hpp"

namespace vigil::app {

using namespace vigil::app::query;

namespace {

struct FieldAlias { const char* word; QueryField field; };

constexpr FieldAlias kFields[] = {
  {"pid", QueryField::Pid},
  {"cpu", QueryField::Cpu}, {"cpu%", QueryField::Cpu},
  {"mem", QueryField::Mem}, {"mem%", QueryField::Mem},
  {"memb", QueryField::MemBytes},
  {"read", QueryField::ReadRate}, {"rps", QueryField::ReadRate},
  {"write", QueryField::WriteRate}, {"wps", QueryField::WriteRate},
  {"tread", QueryField::ReadTotal}, {"twrite", QueryField::WriteTotal},
  {"name", QueryField::Name},
  {"cmd", QueryField::Command}, {"command", QueryField::Command},
  {"user", QueryField::User},
  {"state", QueryField::State},
};

constexpr int kMaxDepth = 64;

// Unwinds the recursive descent; converted to ParseError in parse_query.
struct Failure {
  size_t pos;
  std::string reason;
};

const FieldAlias* lookup_field(std::string_view word) {
  for (const auto& f : kFields)
    if (vigil::util::ascii_iequals(word, f.word)) return &f;
  return nullptr;
}

bool parse_op(std::string_view sym, CompareOp& op) {
  if (sym == ">") op = CompareOp::Gt;
  else if (sym == "<") op = CompareOp::Lt;
  else if (sym == ">=") op = CompareOp::Ge;
  else if (sym == "<=") op = CompareOp::Le;
  else if (sym == "=") op = CompareOp::Eq;
  else if (sym == "!=") op = CompareOp::Ne;
  else return false;
  return true;
}

// Leading decimal number of `s`; `rest` receives the unparsed suffix.
bool leading_number(std::string_view s, double& value, std::string_view& rest) {
  const char* b = s.data();
  const char* e = s.data() + s.size();
  bool negative = false;
  if (b != e && (*b == '+' || *b == '-')) negative = *b++ == '-';
  if (b == e || *b == '+' || *b == '-') return false;
  auto [p, ec] = std::from_chars(b, e, value, std::chars_format::fixed);
  if (ec != std::errc{} || p == b) return false;
  if (negative) value = -value;
  rest = std::string_view(p, static_cast<size_t>(e - p));
  return std::isfinite(value);
}

class Parser {
public:
  Parser(const std::vector<Token>& toks, const QueryOptions& opts) : toks_(toks), opts_(opts) {}

  NodePtr parse() {
    if (peek().kind == TokKind::End) return nullptr;
    auto n = parse_or(0);
    if (peek().kind == TokKind::RParen) fail(peek().pos, "unbalanced ')'");
    if (peek().kind != TokKind::End) fail(peek().pos, "unexpected '" + peek().text + "'");
    return n;
  }

private:
  const std::vector<Token>& toks_;
  const QueryOptions& opts_;
  size_t i_{0};

  const Token& peek(size_t ahead = 0) const {
    size_t k = i_ + ahead;
    return k < toks_.size() ? toks_[k] : toks_.back();
  }
  const Token& next() {
    const Token& t = peek();
    if (i_ < toks_.size() - 1) ++i_;
    return t;
  }
  [[noreturn]] static void fail(size_t pos, std::string reason) { throw Failure{pos, std::move(reason)}; }

  static NodePtr make(Node n) { return std::make_unique<const Node>(std::move(n)); }

  bool starts_term() const {
    auto k = peek().kind;
    return k == TokKind::LParen || k == TokKind::Word || k == TokKind::Op;
  }

  NodePtr parse_or(int depth) {
    auto left = parse_and(depth);
    while (peek().kind == TokKind::Or) {
      const Token& kw = next();
      if (!starts_term()) fail(peek().pos, "expected a term after '" + kw.text + "'");
      auto right = parse_and(depth);
      left = make(Node{Or{std::move(left), std::move(right)}});
    }
    return left;
  }

  NodePtr parse_and(int depth) {
    auto left = parse_term(depth);
    for (;;) {
      if (peek().kind == TokKind::And) {
        const Token& kw = next();
        if (!starts_term()) fail(peek().pos, "expected a term after '" + kw.text + "'");
      } else if (!starts_term()) {
        break;
      }
      auto right = parse_term(depth);
      left = make(Node{And{std::move(left), std::move(right)}});
    }
    return left;
  }

  NodePtr parse_term(int depth) {
    const Token& t = peek();
    switch (t.kind) {
      case TokKind::LParen: {
        if (depth >= kMaxDepth) fail(t.pos, "parentheses nested too deeply");
        next();
        if (peek().kind == TokKind::RParen) fail(peek().pos, "empty parentheses");
        auto inner = parse_or(depth + 1);
        if (peek().kind != TokKind::RParen) fail(t.pos, "unbalanced '(': missing ')'");
        next();
        return inner;
      }
      case TokKind::RParen:
        fail(t.pos, "unbalanced ')'");
      case TokKind::Op:
        fail(t.pos, "expected a field name before '" + t.text + "'");
      case TokKind::And:
      case TokKind::Or:
        fail(t.pos, "expected a term before '" + t.text + "'");
      case TokKind::End:
        fail(t.pos, "expected a term");
      case TokKind::Word:
        break;
    }
    next();
    const FieldAlias* f = t.quoted ? nullptr : lookup_field(t.text);
    if (!f) {
      if (peek().kind == TokKind::Op) fail(t.pos, "unknown field '" + t.text + "'");
      return make_string(QueryField::Any, MatchKind::Contains, t);
    }
    if (is_numeric_field(f->field)) return parse_comparison(f->field, t);
    return parse_string_term(f->field, t);
  }

  NodePtr parse_comparison(QueryField field, const Token& field_tok) {
    if (peek().kind != TokKind::Op) fail(peek().pos, "expected comparison operator after '" + field_tok.text + "'");
    const Token& op_tok = next();
    CompareOp op{};
    if (!parse_op(op_tok.text, op)) fail(op_tok.pos, "unknown operator '" + op_tok.text + "'");
    if (peek().kind != TokKind::Word) fail(peek().pos, "expected a number after '" + op_tok.text + "'");
    const Token& val_tok = next();

    double value = 0.0;
    std::string_view rest;
    if (!leading_number(val_tok.text, value, rest)) fail(val_tok.pos, "invalid number '" + val_tok.text + "'");
    std::string unit(rest);
    size_t unit_pos = val_tok.pos + (val_tok.text.size() - rest.size());
    // A unit may also follow as its own word: "memb > 2 GiB"
    if (unit.empty() && peek().kind == TokKind::Word && !peek().quoted) {
      const auto& cand = peek().text;
      bool take = (is_byte_field(field) && vigil::util::byte_unit_multiplier(cand)) ||
                  (is_percent_field(field) && cand == "%");
      if (take) { unit_pos = peek().pos; unit = next().text; }
    }
    if (!unit.empty()) {
      if (is_percent_field(field) && unit == "%") {
        // plain percent
      } else if (is_byte_field(field)) {
        auto mult = vigil::util::byte_unit_multiplier(unit);
        if (!mult) fail(unit_pos, "unknown byte unit '" + unit + "'");
        value *= *mult;
      } else {
        fail(unit_pos, std::string("unit not allowed for field '") + field_name(field) + "'");
      }
    }
    return make(Node{Comparison{field, op, value}});
  }

  NodePtr parse_string_term(QueryField field, const Token& field_tok) {
    MatchKind kind = MatchKind::Contains;
    if (peek().kind == TokKind::Op) {
      const Token& op_tok = next();
      if (op_tok.text == "=") kind = MatchKind::Equals;
      else if (op_tok.text == "!=") kind = MatchKind::NotEquals;
      else fail(op_tok.pos, "operator '" + op_tok.text + "' not valid for text field '" + field_tok.text + "'");
    }
    if (peek().kind != TokKind::Word) fail(peek().pos, "expected a value after '" + field_tok.text + "'");
    return make_string(field, kind, next());
  }

  NodePtr make_string(QueryField field, MatchKind kind, const Token& tok) {
    StringMatch m{field, kind, tok.text, opts_.ignore_case, opts_.whole_word,
                  vigil::util::BoyerMooreSearch(tok.text, opts_.ignore_case), nullptr};
    if (opts_.regex) {
      auto flags = std::regex::ECMAScript;
      if (opts_.ignore_case) flags |= std::regex::icase;
      std::string pat = opts_.whole_word ? "\\b(?:" + tok.text + ")\\b" : tok.text;
      try {
        m.regex = std::make_shared<const std::regex>(pat, flags);
      } catch (const std::regex_error& e) {
        fail(tok.pos, std::string("invalid regex: ") + e.what());
      }
    }
    return make(Node{std::move(m)});
  }
};

} // namespace

bool is_numeric_field(QueryField f) {
  switch (f) {
    case QueryField::Pid: case QueryField::Cpu: case QueryField::Mem: case QueryField::MemBytes:
    case QueryField::ReadRate: case QueryField::WriteRate: case QueryField::ReadTotal: case QueryField::WriteTotal:
      return true;
    default:
      return false;
  }
}

bool is_byte_field(QueryField f) {
  return f == QueryField::MemBytes || f == QueryField::ReadRate || f == QueryField::WriteRate ||
         f == QueryField::ReadTotal || f == QueryField::WriteTotal;
}

bool is_percent_field(QueryField f) { return f == QueryField::Cpu || f == QueryField::Mem; }

const char* field_name(QueryField f) {
  switch (f) {
    case QueryField::Pid: return "pid";
    case QueryField::Cpu: return "cpu";
    case QueryField::Mem: return "mem";
    case QueryField::MemBytes: return "memb";
    case QueryField::ReadRate: return "read";
    case QueryField::WriteRate: return "write";
    case QueryField::ReadTotal: return "tread";
    case QueryField::WriteTotal: return "twrite";
    case QueryField::Name: return "name";
    case QueryField::Command: return "cmd";
    case QueryField::User: return "user";
    case QueryField::State: return "state";
    case QueryField::Any: return "any";
  }
  return "?";
}

const char* op_symbol(CompareOp op) {
  switch (op) {
    case CompareOp::Gt: return ">";
    case CompareOp::Lt: return "<";
    case CompareOp::Ge: return ">=";
    case CompareOp::Le: return "<=";
    case CompareOp::Eq: return "=";
    case CompareOp::Ne: return "!=";
  }
  return "?";
}

bool parse_query(std::string_view text, const QueryOptions& opts, Query& out, ParseError& err) {
  std::vector<Token> toks;
  size_t pos = 0;
  std::string reason;
  if (!tokenize(text, toks, pos, reason)) {
    err = ParseError{pos, std::move(reason)};
    return false;
  }
  NodePtr root;
  try {
    root = Parser(toks, opts).parse();
  } catch (const Failure& f) {
    err = ParseError{f.pos, f.reason};
    return false;
  }
  Query q;
  q.root_ = std::shared_ptr<const Node>(std::move(root));
  q.text_ = std::string(text);
  q.opts_ = opts;
  out = std::move(q);
  return true;
}

std::string Query::describe() const {
  return root_ ? query::describe(*root_) : std::string("(all)");
}

} // namespace vigil::app
