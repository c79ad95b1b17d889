#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          (std::string("procstat_test_toml_") + suffix + "_" + std::to_string(::getpid()) + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  procstat::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/procstat_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[procstat]\n"
    "limit = 25\n"
    "sort = \"mem\"\n"
    "threads = true\n"
  );
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("procstat", "limit"), "25");
  ASSERT_EQ(tr.get_string("procstat", "sort"), "mem");
  ASSERT_EQ(tr.get_string("procstat", "threads"), "true");
  ASSERT_TRUE(tr.bad_lines().empty());
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[procstat]\nlimit = 5\n");
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("procstat", "missing_key", "fallback"), "fallback");
  // Missing section entirely
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_TRUE(!tr.has("nosection", "key"));
  remove_file(path);
}

TEST(toml_has) {
  auto path = tmp_path("has");
  write_file(path, "[procstat]\nverbose = false\n");
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.has("procstat", "verbose"));
  ASSERT_TRUE(!tr.has("procstat", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "verbose"));
  remove_file(path);
}

TEST(toml_quoted_strings_and_comments) {
  auto path = tmp_path("quoted");
  write_file(path,
    "# Top-level comment\n"
    "\n"
    "[ s ]  \n"
    "  plain  =  hello  \n"
    "quoted = \"world\"   # trailing comment\n"
    "empty = \"\"\n"
    "hash = \"#not-a-comment\"\n"
    "  key2 = 10\n"
  );
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("s", "plain"), "hello");
  ASSERT_EQ(tr.get_string("s", "quoted"), "world");
  ASSERT_EQ(tr.get_string("s", "empty"), "");
  ASSERT_EQ(tr.get_string("s", "hash"), "#not-a-comment");
  ASSERT_EQ(tr.get_string("s", "key2"), "10");
  remove_file(path);
}

TEST(toml_last_assignment_wins) {
  auto path = tmp_path("dup");
  write_file(path, "[procstat]\nlimit = 5\nlimit = 8\n[procstat]\nsort = pid\n");
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("procstat", "limit"), "8");
  ASSERT_EQ(tr.get_string("procstat", "sort"), "pid");
  remove_file(path);
}

TEST(toml_bad_lines_reported) {
  auto path = tmp_path("bad");
  write_file(path, "[procstat\nlimit = 5\njust words\n= 3\n[]\n");
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.bad_lines().size(), 4u);
  ASSERT_EQ(tr.bad_lines()[0], 1);
  ASSERT_EQ(tr.bad_lines()[1], 3);
  // keys before any valid header land in the unnamed section
  ASSERT_EQ(tr.get_string("", "limit"), "5");
  remove_file(path);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  procstat::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  // Keys before any [section] go under empty-string section
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_string("sec", "other"), "1");
  remove_file(path);
}
