#include <assist/platform/platform.hxx>

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <pwd.h>
#  include <unistd.h>
#  include <sys/types.h>
#endif

#ifdef __APPLE__
#  include <mach-o/dyld.h>
#endif

using namespace std;

namespace assist
{
  platform_paths
  windows_paths (const fs::path& h, const optional<fs::path>& a)
  {
    fs::path ad (a ? *a : h / "AppData" / "Roaming");

    platform_paths r;
    r.home = h;
    r.claude_dir = h / ".claude";
    r.bin_dir = r.claude_dir / "bin";
    r.download_dir = r.claude_dir / "downloads";
    r.editor_settings_dir = ad / "Code" / "User";
    r.certs_dir = h / ".continue" / "certs";
    return r;
  }

  platform_paths
  macos_paths (const fs::path& h)
  {
    platform_paths r;
    r.home = h;
    r.claude_dir = h / ".claude";
    r.bin_dir = r.claude_dir / "bin";
    r.download_dir = r.claude_dir / "downloads";
    r.editor_settings_dir =
      h / "Library" / "Application Support" / "Code" / "User";
    r.certs_dir = h / "certs";
    return r;
  }

  platform_paths
  linux_paths (const fs::path& h)
  {
    platform_paths r;
    r.home = h;
    r.claude_dir = h / ".claude";
    r.bin_dir = r.claude_dir / "bin";
    r.download_dir = r.claude_dir / "downloads";
    r.editor_settings_dir = h / ".config" / "Code" / "User";
    r.certs_dir = h / "certs";
    return r;
  }

  // environment_snapshot
  //
  environment_snapshot environment_snapshot::
  with_variable (const string& n, const string& v) const
  {
    environment_snapshot r (*this);
    r.variables_[n] = v;
    return r;
  }

  environment_snapshot environment_snapshot::
  with_path_entry (const fs::path& p) const
  {
    environment_snapshot r (*this);

    if (find (r.path_entries_.begin (), r.path_entries_.end (), p) ==
        r.path_entries_.end ())
      r.path_entries_.push_back (p);

    return r;
  }

  // posix_environment_writer
  //
  static bool
  on_search_path (const string& d)
  {
    const char* p (getenv ("PATH"));
    if (p == nullptr)
      return false;

    istringstream is (p);
    for (string e; getline (is, e, ':'); )
    {
      if (e == d)
        return true;
    }

    return false;
  }

  environment_result posix_environment_writer::
  apply (const environment_snapshot& s)
  {
    environment_result r;

    for (const auto& [n, v] : s.variables ())
    {
      const char* c (getenv (n.c_str ()));

      if (c != nullptr && v == c)
        r.unchanged.push_back ({n, v, n + " is already set"});
      else
        r.pending.push_back ({n, v, "export " + n + "=\"" + v + "\""});
    }

    for (const fs::path& p : s.path_entries ())
    {
      string d (p.string ());

      if (on_search_path (d))
        r.unchanged.push_back ({"PATH", d, d + " is already in PATH"});
      else
        r.pending.push_back ({"PATH", d, "export PATH=\"" + d + ":$PATH\""});
    }

    return r;
  }

  string
  current_platform_key ()
  {
#if defined(_WIN32)
#  if defined(_M_ARM64) || defined(__aarch64__)
    return "win32-arm64";
#  else
    return "win32-x64";
#  endif
#elif defined(__APPLE__)
#  if defined(__aarch64__) || defined(__arm64__)
    return "darwin-arm64";
#  else
    return "darwin-x64";
#  endif
#else
#  if defined(__aarch64__)
    return "linux-arm64";
#  else
    return "linux-x64";
#  endif
#endif
  }

  string
  current_binary_name ()
  {
#ifdef _WIN32
    return "claude.exe";
#else
    return "claude";
#endif
  }

  fs::path
  home_directory ()
  {
#ifdef _WIN32
    if (const char* v = getenv ("USERPROFILE"))
      return fs::path (v);

    const char* d (getenv ("HOMEDRIVE"));
    const char* p (getenv ("HOMEPATH"));
    if (d != nullptr && p != nullptr)
      return fs::path (string (d) + p);
#else
    if (const char* v = getenv ("HOME"))
    {
      if (*v != '\0')
        return fs::path (v);
    }

    if (const passwd* pw = getpwuid (getuid ()))
    {
      if (pw->pw_dir != nullptr)
        return fs::path (pw->pw_dir);
    }
#endif

    throw runtime_error ("unable to determine home directory");
  }

  fs::path
  current_executable_path ()
  {
    error_code ec;

#if defined(_WIN32)
    wchar_t b[MAX_PATH];
    DWORD l (GetModuleFileNameW (nullptr, b, MAX_PATH));
    if (l > 0 && l < MAX_PATH)
      return fs::path (b);
#elif defined(__APPLE__)
    char b[4096];
    uint32_t n (sizeof (b));
    if (_NSGetExecutablePath (b, &n) == 0)
    {
      fs::path r (fs::canonical (b, ec));
      if (!ec)
        return r;
    }
#else
    fs::path r (fs::read_symlink ("/proc/self/exe", ec));
    if (!ec)
      return r;
#endif

    return fs::current_path (ec);
  }
}
