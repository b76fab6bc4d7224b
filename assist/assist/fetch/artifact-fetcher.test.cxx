#include <assist/fetch/artifact-fetcher.hxx>

#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include <assist/fetch/fetch-digest.hxx>

using namespace std;
using namespace assist;

namespace asio = boost::asio;
namespace fs = std::filesystem;

// Scratch directory removed on destruction.
//
struct temp_dir
{
  fs::path path;

  explicit
  temp_dir (const string& n)
  {
    auto t (chrono::steady_clock::now ().time_since_epoch ().count ());
    path = fs::temp_directory_path () /
           ("assist-" + n + "-" + std::to_string (t));
    fs::create_directories (path);
  }

  ~temp_dir ()
  {
    error_code ec;
    fs::remove_all (path, ec);
  }
};

static void
write_file (const fs::path& p, const string& s)
{
  fs::create_directories (p.parent_path ());
  ofstream ofs (p, ios::binary);
  ofs << s;
  assert (ofs);
}

// Remote store serving files from memory.
//
struct mock_remote
{
  map<string, string> files;

  // Fail every request as if the host was unreachable.
  //
  bool reachable = true;

  // Write half of the file before failing the download.
  //
  bool truncate_downloads = false;

  vector<string> requests;

  asio::awaitable<string>
  fetch_text (const string& r)
  {
    requests.push_back (r);

    if (!reachable)
      throw runtime_error ("connection refused");

    auto i (files.find (r));
    if (i == files.end ())
      throw runtime_error ("404 Not Found");

    co_return i->second;
  }

  asio::awaitable<void>
  fetch_file (const string& r,
              const fs::path& t,
              function<void (uint64_t, uint64_t)> cb)
  {
    requests.push_back (r);

    if (!reachable)
      throw runtime_error ("connection refused");

    auto i (files.find (r));
    if (i == files.end ())
      throw runtime_error ("404 Not Found");

    const string& s (i->second);

    if (truncate_downloads)
    {
      write_file (t, s.substr (0, s.size () / 2));
      throw runtime_error ("connection reset by peer");
    }

    write_file (t, s);

    if (cb)
      cb (s.size (), s.size ());

    co_return;
  }
};

// Runner recording its invocations instead of spawning anything.
//
struct mock_runner
{
  struct call
  {
    fs::path program;
    vector<string> args;
    bool program_existed;
  };

  vector<call> calls;
  int exit_code = 0;
  bool fail_to_start = false;

  // What the installer does to its own file while running.
  //
  function<void (const fs::path&)> step;

  asio::awaitable<int>
  run (const fs::path& p, const vector<string>& as)
  {
    calls.push_back (call {p, as, fs::exists (p)});

    if (fail_to_start)
      throw runtime_error ("exec format error");

    if (step)
      step (p);

    co_return exit_code;
  }
};

using test_traits = artifact_fetcher_traits<mock_remote,
                                            local_store,
                                            mock_runner>;

using test_fetcher = basic_artifact_fetcher<test_traits>;

static const string binary_content ("#!/bin/sh\necho installed\n");
static const string binary_name ("claude");
static const string platform ("linux-x64");

static string
manifest_json (const string& version,
               const string& platform,
               const string& checksum,
               uint64_t size = 0)
{
  string r ("{\"version\":\"" + version + "\",\"platforms\":{\"" + platform +
            "\":{\"checksum\":\"" + checksum + "\"");

  if (size != 0)
    r += ",\"size\":" + std::to_string (size);

  return r + "}}}";
}

// Publish a release with a correct manifest in the given mock remote.
//
static void
publish (mock_remote& r, const string& v)
{
  r.files["latest"] = v + "\n";
  r.files[v + "/manifest.json"] =
    manifest_json (v, platform, sha256_string (binary_content));
  r.files[v + "/" + platform + "/" + binary_name] = binary_content;
}

// Same for a local fallback store rooted at d.
//
static void
publish (const fs::path& d, const string& v)
{
  write_file (d / "latest", v + "\n");
  write_file (d / v / "manifest.json",
              manifest_json (v, platform, sha256_string (binary_content)));
  write_file (d / v / platform / binary_name, binary_content);
}

struct fixture
{
  temp_dir tmp {"fetcher"};
  fs::path store_dir {tmp.path / "local"};
  fs::path download_dir {tmp.path / "downloads"};

  asio::io_context ioc;
  mock_remote remote;
  local_store local {store_dir};
  mock_runner runner;
  test_fetcher fetcher {remote, local, runner, download_dir};

  vector<fetch_state> states;
  vector<fetch_state> fallbacks;
  vector<string> warnings;

  fixture ()
  {
    fs::create_directories (store_dir);

    fetcher.on_state ([this] (fetch_state s) {states.push_back (s);});
    fetcher.on_fallback ([this] (fetch_state s, const string&)
                         {
                           fallbacks.push_back (s);
                         });
    fetcher.on_warning ([this] (const string& m) {warnings.push_back (m);});
  }

  template <typename R>
  R
  sync (asio::awaitable<R> a)
  {
    auto f (asio::co_spawn (ioc, std::move (a), asio::use_future));
    ioc.restart ();
    ioc.run ();
    return f.get ();
  }

  bool
  downloads_empty () const
  {
    error_code ec;
    return !fs::exists (download_dir, ec) || fs::is_empty (download_dir, ec);
  }
};

static install_target
target (const string& s)
{
  auto t (parse_install_target (s));
  assert (t);
  return *t;
}

// Return the local and remote causes nested in a fallback failure.
//
static pair<string, string>
fallback_causes (const exception& e)
{
  try
  {
    rethrow_if_nested (e);
  }
  catch (const runtime_error& l)
  {
    try
    {
      rethrow_if_nested (l);
    }
    catch (const runtime_error& r)
    {
      return {l.what (), r.what ()};
    }
  }

  assert (false);
  return {};
}

// A binary whose digest does not match the manifest is deleted and never
// executed.
//
static void
test_checksum_gate ()
{
  // Corrupted remote binary.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    f.remote.files["1.2.3/linux-x64/claude"] = "#!/bin/sh\nrm -rf ~\n";

    install_target t (target ("latest"));

    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
      assert (false);
    }
    catch (const checksum_mismatch_error& e)
    {
      assert (e.stage () == fetch_state::verifying);
      assert (e.expected () == sha256_string (binary_content));
      assert (e.actual () == sha256_string ("#!/bin/sh\nrm -rf ~\n"));
    }

    assert (f.runner.calls.empty ());
    assert (f.downloads_empty ());
    assert (f.fetcher.state () == fetch_state::failed);
  }

  // A good local copy does not rescue a bad remote one.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    publish (f.store_dir, "1.2.3");
    f.remote.files["1.2.3/linux-x64/claude"] = "tampered";

    install_target t (target ("1.2.3"));

    bool thrown (false);
    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
    }
    catch (const checksum_mismatch_error&)
    {
      thrown = true;
    }

    assert (thrown);
    assert (f.fallbacks.empty ());
    assert (f.runner.calls.empty ());
    assert (f.downloads_empty ());
  }

  // Upper-case manifest digest still matches.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");

    string h (sha256_string (binary_content));
    for (char& c : h)
      c = static_cast<char> (toupper (static_cast<unsigned char> (c)));

    f.remote.files["1.2.3/manifest.json"] =
      manifest_json ("1.2.3", platform, h);

    install_target t (target ("latest"));
    install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

    assert (o.exit_code == 0);
    assert (f.runner.calls.size () == 1);
  }
}

// Size listed in the manifest is checked before the digest.
//
static void
test_size_mismatch ()
{
  fixture f;
  publish (f.remote, "1.2.3");
  f.remote.files["1.2.3/manifest.json"] =
    manifest_json ("1.2.3",
                   platform,
                   sha256_string (binary_content),
                   binary_content.size () + 1);

  resolved_version v {"1.2.3", artifact_source::requested};
  fetched_manifest m (f.sync (f.fetcher.fetch_manifest (v)));
  checksum_entry e (f.fetcher.select_platform_entry (m.manifest, platform));

  try
  {
    f.sync (f.fetcher.download_and_verify (v, platform, binary_name, e));
    assert (false);
  }
  catch (const checksum_mismatch_error& x)
  {
    assert (x.expected () == std::to_string (binary_content.size () + 1));
    assert (x.actual () == std::to_string (binary_content.size ()));
  }

  assert (f.downloads_empty ());
}

// Unreachable remote falls back to the local pointer.
//
static void
test_fallback ()
{
  {
    fixture f;
    f.remote.reachable = false;
    write_file (f.store_dir / "latest", "1.2.3\n");

    install_target t (target ("latest"));
    resolved_version v (f.sync (f.fetcher.resolve_version (t)));

    assert (v.value == "1.2.3");
    assert (v.source == artifact_source::local_fallback);
    assert (f.fallbacks.size () == 1);
    assert (f.fallbacks[0] == fetch_state::resolving_version);
  }

  // Every stage falls back independently and records its source.
  //
  {
    fixture f;
    publish (f.store_dir, "1.2.3");
    f.remote.files["latest"] = "1.2.3";

    install_target t (target ("latest"));
    install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

    assert (o.version.source == artifact_source::remote);
    assert (o.manifest_source == artifact_source::local_fallback);
    assert (o.binary_source == artifact_source::local_fallback);
    assert (f.runner.calls.size () == 1);
  }

  // Partial remote download is discarded before the local copy.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    publish (f.store_dir, "1.2.3");
    f.remote.truncate_downloads = true;

    install_target t (target ("latest"));
    install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

    assert (o.binary_source == artifact_source::local_fallback);
    assert (f.fallbacks.size () == 1);
    assert (f.fallbacks[0] == fetch_state::downloading);
    assert (f.runner.calls.size () == 1);
  }

  // Both sources down.
  //
  {
    fixture f;
    f.remote.reachable = false;

    install_target t (target ("stable"));

    try
    {
      f.sync (f.fetcher.resolve_version (t));
      assert (false);
    }
    catch (const resolution_error& e)
    {
      assert (e.stage () == fetch_state::resolving_version);

      // Local failure is nested, the remote one inside it.
      //
      try
      {
        rethrow_if_nested (e);
        assert (false);
      }
      catch (const runtime_error& l)
      {
        assert (string (l.what ()).find ("local fallback") == 0);

        try
        {
          rethrow_if_nested (l);
          assert (false);
        }
        catch (const runtime_error& r)
        {
          assert (string (r.what ()) == "remote: connection refused");
        }
      }
    }

    assert (f.remote.requests.size () == 1);
    assert (f.remote.requests[0] == "stable");
  }

  // Remote pointer with garbage is not silently replaced.
  //
  {
    fixture f;
    f.remote.files["latest"] = "<html>captive portal</html>";
    write_file (f.store_dir / "latest", "1.2.3\n");

    install_target t (target ("latest"));

    bool thrown (false);
    try
    {
      f.sync (f.fetcher.resolve_version (t));
    }
    catch (const resolution_error&)
    {
      thrown = true;
    }

    assert (thrown);
    assert (f.fallbacks.empty ());
  }

  // No manifest anywhere.
  //
  {
    fixture f;
    f.remote.files["latest"] = "1.2.3\n";

    install_target t (target ("latest"));

    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
      assert (false);
    }
    catch (const manifest_error& e)
    {
      assert (e.stage () == fetch_state::fetching_manifest);

      pair<string, string> c (fallback_causes (e));
      assert (c.first.find ("local fallback") == 0);
      assert (c.second == "remote: 404 Not Found");
    }

    assert (f.fallbacks.size () == 1);
    assert (f.fallbacks[0] == fetch_state::fetching_manifest);
    assert (f.runner.calls.empty ());
    assert (f.fetcher.state () == fetch_state::failed);
  }

  // Download cut short and no local copy: nothing is left behind.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    f.remote.truncate_downloads = true;

    install_target t (target ("latest"));

    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
      assert (false);
    }
    catch (const download_error& e)
    {
      assert (e.stage () == fetch_state::downloading);

      pair<string, string> c (fallback_causes (e));
      assert (c.first.find ("local fallback") == 0);
      assert (c.second == "remote: connection reset by peer");
    }

    assert (f.fallbacks.size () == 1);
    assert (f.fallbacks[0] == fetch_state::downloading);
    assert (f.runner.calls.empty ());
    assert (f.downloads_empty ());
    assert (f.fetcher.state () == fetch_state::failed);
  }
}

// Missing platform fails before anything is downloaded.
//
static void
test_unsupported_platform ()
{
  fixture f;
  publish (f.remote, "1.2.3");

  install_target t (target ("latest"));

  try
  {
    f.sync (f.fetcher.install (t, "freebsd-riscv64", binary_name));
    assert (false);
  }
  catch (const unsupported_platform_error& e)
  {
    assert (e.platform () == "freebsd-riscv64");
    assert (e.stage () == fetch_state::selecting_platform);
  }

  assert (!fs::exists (f.download_dir));
  assert (f.remote.requests.size () == 2);
  assert (f.runner.calls.empty ());

  assert (f.states.back () == fetch_state::failed);
  assert (f.states[f.states.size () - 2] == fetch_state::selecting_platform);
}

// The artifact is removed whatever the installer does.
//
static void
test_cleanup ()
{
  // Success.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");

    install_target t (target ("latest"));
    f.sync (f.fetcher.install (t, platform, binary_name));

    assert (f.runner.calls.size () == 1);
    assert (f.runner.calls[0].program_existed);
    assert (!fs::exists (f.runner.calls[0].program));
    assert (f.downloads_empty ());
  }

  // Non-zero exit.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    f.runner.exit_code = 3;

    install_target t (target ("latest"));

    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
      assert (false);
    }
    catch (const installer_subprocess_error& e)
    {
      assert (e.exit_code () == 3);
    }

    assert (f.runner.calls.size () == 1);
    assert (!fs::exists (f.runner.calls[0].program));

    vector<fetch_state> tail (f.states.end () - 3, f.states.end ());
    assert ((tail == vector<fetch_state> {fetch_state::installing,
                                          fetch_state::cleanup,
                                          fetch_state::failed}));
  }

  // Installer cannot be started.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    f.runner.fail_to_start = true;

    install_target t (target ("latest"));

    try
    {
      f.sync (f.fetcher.install (t, platform, binary_name));
      assert (false);
    }
    catch (const installer_subprocess_error& e)
    {
      assert (e.exit_code () == -1);
    }

    assert (f.downloads_empty ());
    assert (f.warnings.empty ());
  }

  // Artifact cannot be removed: a warning, not a failure.
  //
  {
    fixture f;
    publish (f.remote, "1.2.3");
    f.runner.step = [] (const fs::path& p)
    {
      fs::remove (p);
      write_file (p / "stale", "x");
    };

    install_target t (target ("latest"));
    install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

    assert (o.exit_code == 0);
    assert (f.warnings.size () == 1);
    assert (f.warnings[0].find ("unable to remove") == 0);
    assert (f.fetcher.state () == fetch_state::done);
  }
}

// A concrete version never touches the network.
//
static void
test_concrete_version ()
{
  fixture f;

  for (const char* s : {"1.2.3", "2.0.0-beta.1", "0.0.1-rc.1"})
  {
    install_target t (target (s));
    resolved_version v (f.sync (f.fetcher.resolve_version (t)));

    assert (v.value == s);
    assert (v.source == artifact_source::requested);
  }

  assert (f.remote.requests.empty ());
  assert (f.fallbacks.empty ());
}

// Malformed manifest is not a transport failure.
//
static void
test_malformed_manifest ()
{
  fixture f;
  publish (f.store_dir, "1.2.3");
  f.remote.files["1.2.3/manifest.json"] = "{\"platforms\": [";

  resolved_version v {"1.2.3", artifact_source::requested};

  try
  {
    f.sync (f.fetcher.fetch_manifest (v));
    assert (false);
  }
  catch (const manifest_error& e)
  {
    assert (e.stage () == fetch_state::fetching_manifest);
  }

  assert (f.fallbacks.empty ());
}

// A malformed entry for another platform does not get in the way.
//
static void
test_unrelated_entry ()
{
  fixture f;
  publish (f.remote, "1.2.3");
  f.remote.files["1.2.3/manifest.json"] =
    "{\"platforms\":{\"win32-x64\":{\"checksum\":\"tbd\"},\"" + platform +
    "\":{\"checksum\":\"" + sha256_string (binary_content) + "\"}}}";

  install_target t (target ("latest"));
  install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

  assert (o.exit_code == 0);
  assert (f.runner.calls.size () == 1);

  try
  {
    f.sync (f.fetcher.install (t, "win32-x64", "claude.exe"));
    assert (false);
  }
  catch (const manifest_error&)
  {
  }
}

// End to end: the installer is invoked once with the original target.
//
static void
test_happy_path ()
{
  fixture f;
  publish (f.remote, "1.2.3");

  uint64_t progress (0);
  f.fetcher.on_progress ([&progress] (uint64_t b, uint64_t) {progress = b;});

  install_target t (target ("latest"));
  install_outcome o (f.sync (f.fetcher.install (t, platform, binary_name)));

  assert (o.exit_code == 0);
  assert (o.version.value == "1.2.3");
  assert (o.version.source == artifact_source::remote);
  assert (o.manifest_source == artifact_source::remote);
  assert (o.binary_source == artifact_source::remote);
  assert (progress == binary_content.size ());

  assert (f.runner.calls.size () == 1);
  assert ((f.runner.calls[0].args == vector<string> {"install", "latest"}));
  assert (f.runner.calls[0].program.filename () == "claude-1.2.3-linux-x64");

  assert ((f.remote.requests == vector<string> {"latest",
                                                "1.2.3/manifest.json",
                                                "1.2.3/linux-x64/claude"}));

  assert ((f.states == vector<fetch_state> {fetch_state::resolving_version,
                                            fetch_state::fetching_manifest,
                                            fetch_state::selecting_platform,
                                            fetch_state::downloading,
                                            fetch_state::verifying,
                                            fetch_state::installing,
                                            fetch_state::cleanup,
                                            fetch_state::done}));

  assert (f.fetcher.state () == fetch_state::done);
  assert (f.downloads_empty ());
}

int
main ()
{
  test_checksum_gate ();
  test_size_mismatch ();
  test_fallback ();
  test_unsupported_platform ();
  test_cleanup ();
  test_concrete_version ();
  test_malformed_manifest ();
  test_unrelated_entry ();
  test_happy_path ();

  cout << "all artifact fetcher tests passed" << endl;
  return 0;
}
