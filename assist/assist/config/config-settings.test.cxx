#include <assist/config/config-settings.hxx>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace std;
using namespace assist;

namespace fs = std::filesystem;
namespace json = boost::json;

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  ostringstream os;
  os << ifs.rdbuf ();
  return os.str ();
}

static void
write_file (const fs::path& p, const string& s)
{
  ofstream ofs (p, ios::binary);
  ofs << s;
}

// Source members win, unrelated target members survive.
//
static void
test_merge ()
{
  json::object t (parse_settings (
    R"({"editor.fontSize": 12, "theme": "dark", "nested": {"a": 1}})",
    "target"));

  json::object s (parse_settings (
    R"({"theme": "light", "nested": {"b": 2}, "http.proxy": "x"})",
    "source"));

  json::object m (merge_settings (t, s));

  assert (m.at ("editor.fontSize").as_int64 () == 12);
  assert (m.at ("theme").as_string () == "light");
  assert (m.at ("http.proxy").as_string () == "x");

  // Shallow: nested objects are replaced, not merged.
  //
  assert (m.at ("nested").as_object ().size () == 1);
  assert (m.at ("nested").as_object ().contains ("b"));
}

static void
test_parse ()
{
  // Comments and trailing commas as found in VS Code settings.
  //
  json::object o (parse_settings (R"({
    // Corporate proxy.
    "http.proxy": "http://proxy:8080",
    /* block */ "x": [1, 2,],
  })", "settings.json"));

  assert (o.size () == 2);

  bool thrown (false);
  try
  {
    parse_settings ("[1, 2]", "array.json");
  }
  catch (const runtime_error& e)
  {
    thrown = string (e.what ()).find ("array.json") != string::npos;
  }
  assert (thrown);

  thrown = false;
  try
  {
    parse_settings ("{\"a\":", "broken.json");
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_format ()
{
  json::object o;
  o["b"] = 1;
  o["a"] = json::array {true, nullptr, "s"};
  o["e"] = json::object ();

  string s (format_settings (o));

  assert (s ==
          "{\n"
          "  \"b\": 1,\n"
          "  \"a\": [\n"
          "    true,\n"
          "    null,\n"
          "    \"s\"\n"
          "  ],\n"
          "  \"e\": {}\n"
          "}\n");

  // Output parses back to the same value.
  //
  assert (parse_settings (s, "formatted") == o);
}

static void
test_deploy ()
{
  auto t (chrono::steady_clock::now ().time_since_epoch ().count ());
  fs::path d (fs::temp_directory_path () /
              ("assist-settings-" + std::to_string (t)));
  fs::create_directories (d);

  fs::path src (d / "src.json");
  fs::path dst (d / "out" / "settings.json");

  assert (deploy_settings (d / "missing.json", dst) == deploy_action::skipped);
  assert (!fs::exists (dst));

  // Byte copy when there is nothing to merge with.
  //
  write_file (src, "{\"a\": 1}");
  assert (deploy_settings (src, dst) == deploy_action::copied);
  assert (read_file (dst) == "{\"a\": 1}");

  write_file (dst, "{\"a\": 0, \"keep\": true}");
  write_file (src, "{\"a\": 2}");
  assert (deploy_settings (src, dst) == deploy_action::merged);

  json::object m (read_settings (dst));
  assert (m.at ("a").as_int64 () == 2);
  assert (m.at ("keep").as_bool ());

  fs::remove_all (d);
}

int
main ()
{
  test_merge ();
  test_parse ();
  test_format ();
  test_deploy ();

  cout << "all settings tests passed" << endl;
  return 0;
}
