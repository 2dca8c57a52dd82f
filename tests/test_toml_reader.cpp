#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using vigil::util::TomlReader;

TEST(toml_missing_file_fails_load) {
  TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/vigil_test_toml_does_not_exist.toml"));
  ASSERT_EQ(tr.get_int("collection", "rate_ms", 1000), 1000);
}

TEST(toml_load_from_file) {
  auto path = std::filesystem::temp_directory_path() / ("vigil_test_toml_" + std::to_string(::getpid()) + ".toml");
  {
    std::ofstream f(path);
    f << "[collection]\nrate_ms = 500\n[graph]\nheadroom = 1.08\n";
  }
  TomlReader tr;
  ASSERT_TRUE(tr.load(path.string()));
  ASSERT_EQ(tr.get_int("collection", "rate_ms"), 500);
  ASSERT_NEAR(tr.get_double("graph", "headroom"), 1.08, 1e-12);
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_sections_and_types) {
  TomlReader tr;
  tr.parse(
    "top = 1\n"
    "[history]\n"
    "retention_s = 900.5\n"
    "[process]\n"
    "grouped = true\n"
    "sort = \"mem\"\n"
    "neg = -7\n");
  ASSERT_EQ(tr.get_int("", "top"), 1);
  ASSERT_NEAR(tr.get_double("history", "retention_s"), 900.5, 1e-12);
  ASSERT_EQ(tr.get_bool("process", "grouped"), true);
  ASSERT_EQ(tr.get_string("process", "sort"), "mem");
  ASSERT_EQ(tr.get_int("process", "neg"), -7);
  ASSERT_TRUE(tr.has("process", "sort"));
  ASSERT_TRUE(!tr.has("history", "sort"));
}

TEST(toml_bad_values_fall_back) {
  TomlReader tr;
  tr.parse("[n]\nint = 12abc\ndbl = fast\nflag = maybe\n");
  ASSERT_EQ(tr.get_int("n", "int", 99), 99);
  ASSERT_NEAR(tr.get_double("n", "dbl", 2.5), 2.5, 0.0);
  ASSERT_EQ(tr.get_bool("n", "flag", true), true);
  ASSERT_EQ(tr.get_bool("n", "flag", false), false);
}

TEST(toml_comments_stripped_outside_quotes) {
  TomlReader tr;
  tr.parse(
    "# leading comment\n"
    "[ log ]   # section comment\n"
    "debug_file = \"/tmp/a#b.log\"  # trailing\n"
    "level = 3 # trailing\n");
  ASSERT_EQ(tr.get_string("log", "debug_file"), "/tmp/a#b.log");
  ASSERT_EQ(tr.get_int("log", "level"), 3);
}

TEST(toml_later_key_overrides_earlier) {
  TomlReader tr;
  tr.parse("[graph]\ndivisions = 4\n[other]\nx = 1\n[graph]\ndivisions = 5\n");
  ASSERT_EQ(tr.get_int("graph", "divisions"), 5);
}
