#include <assist/fetch/fetch-types.hxx>

#include <cassert>
#include <iostream>
#include <sstream>

using namespace std;
using namespace assist;

// Versions. Leading zeros, empty identifiers, and build metadata are all
// rejected.
//
static void
test_semantic_version ()
{
  {
    auto v (parse_semantic_version ("1.2.3"));
    assert (v);
    assert (v->major == 1 && v->minor == 2 && v->patch == 3);
    assert (v->release ());
    assert (v->string () == "1.2.3");
  }

  {
    auto v (parse_semantic_version ("10.0.0-beta.1"));
    assert (v);
    assert (v->major == 10);
    assert (v->pre_release == "beta.1");
    assert (!v->release ());
    assert (v->string () == "10.0.0-beta.1");
  }

  assert (parse_semantic_version ("0.0.0"));
  assert (parse_semantic_version ("1.2.3-rc-1"));

  assert (!parse_semantic_version (""));
  assert (!parse_semantic_version ("1.2"));
  assert (!parse_semantic_version ("1.2.3.4"));
  assert (!parse_semantic_version ("01.2.3"));
  assert (!parse_semantic_version ("1.2.3-"));
  assert (!parse_semantic_version ("1.2.3-beta..1"));
  assert (!parse_semantic_version ("1.2.3+build"));
  assert (!parse_semantic_version (" 1.2.3"));
  assert (!parse_semantic_version ("v1.2.3"));
  assert (!parse_semantic_version ("99999999999999999999.0.0"));
}

// Targets. Channels are kept symbolic, the original text is preserved.
//
static void
test_install_target ()
{
  {
    auto t (parse_install_target ("latest"));
    assert (t && t->channel == release_channel::latest);
    assert (!t->concrete ());
  }

  {
    auto t (parse_install_target ("stable"));
    assert (t && t->channel == release_channel::stable);
  }

  {
    auto t (parse_install_target ("2.0.1-alpha"));
    assert (t && t->concrete ());
    assert (!t->channel);
    assert (t->text == "2.0.1-alpha");
  }

  assert (!parse_install_target ("Latest"));
  assert (!parse_install_target ("nightly"));
  assert (!parse_install_target ("../../etc/passwd"));
}

// Distribution layout.
//
static void
test_paths ()
{
  assert (pointer_path (release_channel::latest) == "latest");
  assert (pointer_path (release_channel::stable) == "stable");
  assert (manifest_path ("1.2.3") == "1.2.3/manifest.json");
  assert (binary_path ("1.2.3", "darwin-arm64", "claude") ==
          "1.2.3/darwin-arm64/claude");

  assert (artifact_file_name ("1.2.3", "darwin-arm64", "claude") ==
          "claude-1.2.3-darwin-arm64");
  assert (artifact_file_name ("1.2.3", "win32-x64", "claude.exe") ==
          "claude-1.2.3-win32-x64.exe");
}

static void
test_errors ()
{
  unsupported_platform_error e ("linux-arm64");
  assert (e.stage () == fetch_state::selecting_platform);
  assert (e.platform () == "linux-arm64");

  installer_subprocess_error i ("boom", 7);
  assert (i.stage () == fetch_state::installing);
  assert (i.exit_code () == 7);

  ostringstream os;
  os << fetch_state::resolving_version << ';' << artifact_source::local_fallback;
  assert (os.str () == "resolving version;local fallback");
}

int
main ()
{
  test_semantic_version ();
  test_install_target ();
  test_paths ();
  test_errors ();

  cout << "all fetch types tests passed" << endl;
  return 0;
}
