#pragma once
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include "model/Process.hpp"
#include "util/BoyerMoore.hpp"

namespace vigil::app {

// Process filter language.
//
//   expr   := and ( ("or" | "||") and )*
//   and    := term ( ["and" | "&&"] term )*     whitespace between terms is AND
//   term   := "(" expr ")" | numeric-field op number [unit]
//           | string-field [("=" | "!=")] value | bare-word
//
// Bare words match name or command line as a substring. Keywords and field
// names are case-insensitive. `(a) (b)` is a conjunction, never a union.

enum class QueryField {
  Pid, Cpu, Mem, MemBytes, ReadRate, WriteRate, ReadTotal, WriteTotal, // numeric
  Name, Command, User, State,                                         // string
  Any                                                                 // name or command
};

enum class CompareOp { Gt, Lt, Ge, Le, Eq, Ne };
enum class MatchKind { Contains, Equals, NotEquals };

bool is_numeric_field(QueryField f);
bool is_byte_field(QueryField f);
bool is_percent_field(QueryField f);
const char* field_name(QueryField f);
const char* op_symbol(CompareOp op);

struct QueryOptions {
  bool ignore_case{true};
  bool whole_word{false};
  bool regex{false};
};

struct ParseError {
  size_t position{}; // byte offset into the query text
  std::string reason;
};

// Derived per-process I/O rates; invalid for a process's first tick.
struct IoRates {
  bool valid{false};
  double read_per_sec{0.0};
  double write_per_sec{0.0};
};

namespace query {

struct Node;
using NodePtr = std::unique_ptr<const Node>;

struct Comparison {
  QueryField field;
  CompareOp op;
  double literal;
};

struct StringMatch {
  QueryField field;
  MatchKind kind;
  std::string pattern;
  bool case_insensitive;
  bool whole_word;
  vigil::util::BoyerMooreSearch searcher;   // literal mode
  std::shared_ptr<const std::regex> regex;  // regex mode, else null
};

struct And { NodePtr left, right; };
struct Or  { NodePtr left, right; };

struct Node {
  std::variant<Comparison, StringMatch, And, Or> v;
};

// Pure: the same node and inputs always give the same answer.
bool evaluate(const Node& n, const vigil::model::ProcessRecord& r, const IoRates& io);
std::string describe(const Node& n);

} // namespace query

// Immutable compiled filter. A default-constructed Query matches everything.
class Query {
public:
  Query() = default;

  [[nodiscard]] bool empty() const { return !root_; }
  [[nodiscard]] bool matches(const vigil::model::ProcessRecord& r, const IoRates& io = {}) const {
    return !root_ || query::evaluate(*root_, r, io);
  }
  // Canonical prefix form, e.g. (and (any ~ "btm") (cpu > 0))
  [[nodiscard]] std::string describe() const;
  [[nodiscard]] const std::string& text() const { return text_; }
  [[nodiscard]] const QueryOptions& options() const { return opts_; }
  [[nodiscard]] const query::Node* root() const { return root_.get(); }

private:
  friend bool parse_query(std::string_view, const QueryOptions&, Query&, ParseError&);
  std::shared_ptr<const query::Node> root_;
  std::string text_;
  QueryOptions opts_;
};

// Compile `text`. On failure `out` is left untouched and `err` says where.
// Blank text yields the empty (match-all) query.
bool parse_query(std::string_view text, const QueryOptions& opts, Query& out, ParseError& err);

} // namespace vigil::app
