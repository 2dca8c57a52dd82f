// Compiles a process filter and prints its canonical form, or the parse
// error with a caret under the offending position. Search options default to
// the user's config and can be overridden on the command line.

#include "app/Config.hpp"
#include "app/Query.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  auto cfg = vigil::app::load_config();
  vigil::app::apply_logging(cfg);
  auto opts = cfg.search;
  std::string text;
  bool have_text = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--regex") opts.regex = true;
    else if (a == "--whole-word") opts.whole_word = true;
    else if (a == "--case-sensitive") opts.ignore_case = false;
    else if (a == "--debug") vigil::util::log_set_level(vigil::util::LogLevel::Debug);
    else if (a == "-h" || a == "--help") {
      std::cout << "Usage: vigil_query [--regex] [--whole-word] [--case-sensitive] [--debug] FILTER\n";
      return 0;
    } else if (!have_text) {
      text = a;
      have_text = true;
    } else {
      std::fprintf(stderr, "vigil_query: unexpected argument '%s'\n", a.c_str());
      return 2;
    }
  }
  if (!have_text) {
    std::fprintf(stderr, "vigil_query: missing FILTER (see --help)\n");
    return 2;
  }

  vigil::app::Query q;
  vigil::app::ParseError err;
  if (!vigil::app::parse_query(text, opts, q, err)) {
    std::cout << text << "\n" << std::string(err.position, ' ') << "^ " << err.reason << "\n";
    return 1;
  }
  std::cout << q.describe() << "\n";
  return 0;
}
