#include <assist/fetch/fetch-manifest.hxx>

#include <cassert>
#include <iostream>
#include <string>

using namespace std;
using namespace assist;

static const string digest (
  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

static bool
malformed (const string& s)
{
  try
  {
    parse_release_manifest (s);
    return false;
  }
  catch (const manifest_error& e)
  {
    assert (e.stage () == fetch_state::fetching_manifest);
    return true;
  }
}

static void
test_parse ()
{
  string s (R"({
    "version": "1.2.3",
    "buildDate": "2025-01-01T00:00:00Z",
    "platforms": {
      "darwin-arm64": {"checksum": ")" + digest + R"(", "size": 3},
      "linux-x64":    {"checksum": ")" + digest + R"("}
    }
  })");

  release_manifest m (parse_release_manifest (s));

  assert (m.version == "1.2.3");
  assert (m.platforms.size () == 2);

  checksum_entry d (select_platform_entry (m, "darwin-arm64"));
  assert (d.platform == "darwin-arm64");
  assert (d.checksum == digest);
  assert (d.size && *d.size == 3);

  assert (!select_platform_entry (m, "linux-x64").size);
}

// Digest case is normalized on the way in.
//
static void
test_case ()
{
  string u ("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
  release_manifest m (parse_release_manifest (
    R"({"platforms": {"win32-x64": {"checksum": ")" + u + R"("}}})"));

  assert (select_platform_entry (m, "win32-x64").checksum == digest);
}

static void
test_malformed ()
{
  assert (malformed (""));
  assert (malformed ("not json"));
  assert (malformed ("[]"));
  assert (malformed ("{}"));
  assert (malformed (R"({"platforms": []})"));
  assert (malformed (R"({"version": 1, "platforms": {}})"));
}

// A bad entry only matters to the platform it is for.
//
static void
test_malformed_entry ()
{
  auto entry_malformed = [] (const string& e)
  {
    release_manifest m (parse_release_manifest (
      R"({"platforms": {"darwin-arm64": {"checksum": ")" + digest +
      R"("}, "linux-x64": )" + e + "}}"));

    assert (select_platform_entry (m, "darwin-arm64").checksum == digest);

    try
    {
      select_platform_entry (m, "linux-x64");
      return false;
    }
    catch (const manifest_error& x)
    {
      assert (x.stage () == fetch_state::fetching_manifest);
      return true;
    }
  };

  assert (entry_malformed (R"("abc")"));
  assert (entry_malformed ("{}"));
  assert (entry_malformed (R"({"checksum": "abc"})"));
  assert (entry_malformed (R"({"checksum": 42})"));
  assert (entry_malformed (R"({"size": -1, "checksum": ")" + digest + "\"}"));
  assert (entry_malformed (R"({"size": "3", "checksum": ")" + digest + "\"}"));
  assert (entry_malformed (R"({"checksum": ")" + string (64, 'g') + R"("})"));
}

static void
test_select ()
{
  release_manifest m (parse_release_manifest (
    R"({"platforms": {"linux-x64": {"checksum": ")" + digest + R"("}}})"));

  assert (select_platform_entry (m, "linux-x64").checksum == digest);

  try
  {
    select_platform_entry (m, "Linux-x64");
    assert (false);
  }
  catch (const unsupported_platform_error& e)
  {
    assert (e.platform () == "Linux-x64");
  }
}

int
main ()
{
  test_parse ();
  test_case ();
  test_malformed ();
  test_malformed_entry ();
  test_select ();

  cout << "all manifest tests passed" << endl;
  return 0;
}
