#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/sysgraph_test_toml_") + suffix + ".toml";
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
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/sysgraph_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[dashboard]\n"
    "mode = \"one\"\n"
    "port = 9000\n"
    "\n"
    "[sampler]\n"
    "cpu_window_ms = 250\n"
  );
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("dashboard", "mode"), "one");
  ASSERT_EQ(tr.get_int("dashboard", "port"), 9000);
  ASSERT_EQ(tr.get_int("sampler", "cpu_window_ms"), 250);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[dashboard]\nport = 8050\n");
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("dashboard", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("dashboard", "missing_int", 42), 42);
  // Missing section entirely
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  remove_file(path);
}

TEST(toml_has) {
  auto path = tmp_path("has");
  write_file(path, "[log]\nlevel = \"debug\"\n");
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.has("log", "level"));
  ASSERT_TRUE(!tr.has("log", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "level"));
  remove_file(path);
}

TEST(toml_comments_outside_quotes) {
  auto path = tmp_path("comments");
  write_file(path,
    "# leading comment\n"
    "[sampler]   # section comment\n"
    "disk_path = \"/srv/#data\"   # trailing\n"
    "cpu_window_ms = 500 # ms\n"
  );
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("sampler", "disk_path"), "/srv/#data");
  ASSERT_EQ(tr.get_int("sampler", "cpu_window_ms"), 500);
  remove_file(path);
}

TEST(toml_bad_int_uses_default) {
  auto path = tmp_path("badint");
  write_file(path, "[dashboard]\nport = \"eighty\"\n");
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("dashboard", "port", 8050), 8050);
  remove_file(path);
}

TEST(toml_later_key_wins) {
  auto path = tmp_path("dup");
  write_file(path, "[dashboard]\nport = 1\nport = 2\n");
  sysgraph::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("dashboard", "port"), 2);
  remove_file(path);
}
