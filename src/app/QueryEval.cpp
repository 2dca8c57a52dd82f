#include "app/Query.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

namespace vigil::app::query {

template <class> inline constexpr bool kUnhandled = false;

static double numeric_value(QueryField f, const vigil::model::ProcessRecord& r, const IoRates& io) {
  constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();
  switch (f) {
    case QueryField::Pid: return static_cast<double>(r.pid);
    case QueryField::Cpu: return r.cpu_percent;
    case QueryField::Mem: return r.mem_percent;
    case QueryField::MemBytes: return static_cast<double>(r.mem_bytes);
    case QueryField::ReadRate: return io.valid ? io.read_per_sec : kMissing;
    case QueryField::WriteRate: return io.valid ? io.write_per_sec : kMissing;
    case QueryField::ReadTotal: return static_cast<double>(r.read_bytes_total);
    case QueryField::WriteTotal: return static_cast<double>(r.write_bytes_total);
    default: return kMissing;
  }
}

static bool compare(const Comparison& c, const vigil::model::ProcessRecord& r, const IoRates& io) {
  const double v = numeric_value(c.field, r, io);
  if (std::isnan(v)) return false; // missing, including for !=
  switch (c.op) {
    case CompareOp::Gt: return v > c.literal;
    case CompareOp::Lt: return v < c.literal;
    case CompareOp::Ge: return v >= c.literal;
    case CompareOp::Le: return v <= c.literal;
    case CompareOp::Eq: return v == c.literal;
    case CompareOp::Ne: return v != c.literal;
  }
  return false;
}

static bool match_text(const StringMatch& m, std::string_view text) {
  if (m.regex) {
    const std::string s(text);
    switch (m.kind) {
      case MatchKind::Contains: return std::regex_search(s, *m.regex);
      case MatchKind::Equals: return std::regex_match(s, *m.regex);
      case MatchKind::NotEquals: return !std::regex_match(s, *m.regex);
    }
    return false;
  }
  switch (m.kind) {
    case MatchKind::Contains: return m.whole_word ? m.searcher.contains_word(text) : m.searcher.contains(text);
    case MatchKind::Equals: return m.searcher.equals(text);
    case MatchKind::NotEquals: return !m.searcher.equals(text);
  }
  return false;
}

static bool match_field(const StringMatch& m, const vigil::model::ProcessRecord& r) {
  switch (m.field) {
    case QueryField::Name: return match_text(m, r.name);
    case QueryField::Command: return match_text(m, r.command_line);
    case QueryField::User: return match_text(m, r.user);
    case QueryField::State: return match_text(m, vigil::model::state_name(r.state));
    case QueryField::Any:
      return match_text(m, r.name) || match_text(m, r.command_line);
    default:
      return false;
  }
}

bool evaluate(const Node& n, const vigil::model::ProcessRecord& r, const IoRates& io) {
  return std::visit([&](const auto& node) -> bool {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, Comparison>) return compare(node, r, io);
    else if constexpr (std::is_same_v<T, StringMatch>) return match_field(node, r);
    else if constexpr (std::is_same_v<T, And>) return evaluate(*node.left, r, io) && evaluate(*node.right, r, io);
    else if constexpr (std::is_same_v<T, Or>) return evaluate(*node.left, r, io) || evaluate(*node.right, r, io);
    else static_assert(kUnhandled<T>, "query node kind not handled");
  }, n.v);
}

static std::string number_text(double v) {
  char buf[64];
  auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) return "?";
  return std::string(buf, p);
}

static const char* match_symbol(MatchKind k) {
  switch (k) {
    case MatchKind::Contains: return "~";
    case MatchKind::Equals: return "=";
    case MatchKind::NotEquals: return "!=";
  }
  return "?";
}

std::string describe(const Node& n) {
  return std::visit([](const auto& node) -> std::string {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, Comparison>) {
      return std::string("(") + field_name(node.field) + " " + op_symbol(node.op) + " " + number_text(node.literal) + ")";
    } else if constexpr (std::is_same_v<T, StringMatch>) {
      return std::string("(") + field_name(node.field) + " " + match_symbol(node.kind) + " \"" + node.pattern + "\")";
    } else if constexpr (std::is_same_v<T, And>) {
      return "(and " + describe(*node.left) + " " + describe(*node.right) + ")";
    } else if constexpr (std::is_same_v<T, Or>) {
      return "(or " + describe(*node.left) + " " + describe(*node.right) + ")";
    } else {
      static_assert(kUnhandled<T>, "query node kind not handled");
    }
  }, n.v);
}

} // namespace vigil::app::query
