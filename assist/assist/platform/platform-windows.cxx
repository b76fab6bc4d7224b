#ifdef _WIN32

#include <assist/platform/platform.hxx>

#include <cstdlib>
#include <cwctype>
#include <stdexcept>

#include <windows.h>

using namespace std;

namespace assist
{
  namespace
  {
    // HKCU\Environment, closed on destruction.
    //
    class environment_key
    {
    public:
      environment_key ()
      {
        LONG r (RegOpenKeyExW (HKEY_CURRENT_USER,
                               L"Environment",
                               0,
                               KEY_READ | KEY_WRITE,
                               &key_));

        if (r != ERROR_SUCCESS)
          throw runtime_error ("unable to open HKCU\\Environment: error " +
                               std::to_string (r));
      }

      ~environment_key ()
      {
        RegCloseKey (key_);
      }

      environment_key (const environment_key&) = delete;
      environment_key& operator= (const environment_key&) = delete;

      // Return nullopt if the value does not exist.
      //
      optional<wstring>
      get (const wstring& n) const
      {
        DWORD t (0);
        DWORD s (0);

        if (RegQueryValueExW (key_, n.c_str (), nullptr, &t, nullptr, &s) !=
            ERROR_SUCCESS || (t != REG_SZ && t != REG_EXPAND_SZ))
          return nullopt;

        wstring v (s / sizeof (wchar_t), L'\0');

        if (RegQueryValueExW (key_,
                              n.c_str (),
                              nullptr,
                              nullptr,
                              reinterpret_cast<LPBYTE> (v.data ()),
                              &s) != ERROR_SUCCESS)
          return nullopt;

        while (!v.empty () && v.back () == L'\0')
          v.pop_back ();

        return v;
      }

      void
      set (const wstring& n, const wstring& v, DWORD type)
      {
        LONG r (RegSetValueExW (key_,
                                n.c_str (),
                                0,
                                type,
                                reinterpret_cast<const BYTE*> (v.c_str ()),
                                static_cast<DWORD> ((v.size () + 1) *
                                                    sizeof (wchar_t))));

        if (r != ERROR_SUCCESS)
          throw runtime_error ("unable to write HKCU\\Environment: error " +
                               std::to_string (r));
      }

    private:
      HKEY key_ = nullptr;
    };

    wstring
    widen (const string& s)
    {
      if (s.empty ())
        return wstring ();

      int n (MultiByteToWideChar (CP_UTF8, 0, s.data (),
                                  static_cast<int> (s.size ()), nullptr, 0));
      wstring r (static_cast<size_t> (n), L'\0');
      MultiByteToWideChar (CP_UTF8, 0, s.data (),
                           static_cast<int> (s.size ()), r.data (), n);
      return r;
    }

    bool
    iequal (const wstring& x, const wstring& y)
    {
      if (x.size () != y.size ())
        return false;

      for (size_t i (0); i < x.size (); ++i)
      {
        if (towlower (x[i]) != towlower (y[i]))
          return false;
      }

      return true;
    }

    // Tell running programs (Explorer in particular) to reload the
    // environment so that new terminals see the change.
    //
    void
    broadcast_environment_change ()
    {
      DWORD_PTR r (0);
      SendMessageTimeoutW (HWND_BROADCAST,
                           WM_SETTINGCHANGE,
                           0,
                           reinterpret_cast<LPARAM> (L"Environment"),
                           SMTO_ABORTIFHUNG,
                           5000,
                           &r);
    }

    class registry_environment_writer: public environment_writer
    {
    public:
      environment_result
      apply (const environment_snapshot& s) override
      {
        environment_result r;
        environment_key k;

        for (const auto& [n, v] : s.variables ())
        {
          wstring wn (widen (n));
          wstring wv (widen (v));

          optional<wstring> c (k.get (wn));
          if (c && *c == wv)
          {
            r.unchanged.push_back ({n, v, n + " is already set"});
            continue;
          }

          k.set (wn, wv, REG_SZ);
          r.applied.push_back ({n, v, "set " + n + " for the current user"});
        }

        for (const fs::path& p : s.path_entries ())
        {
          string d (p.string ());
          wstring wd (p.wstring ());
          wstring c (k.get (L"Path").value_or (wstring ()));

          bool found (false);
          for (size_t b (0); b <= c.size (); )
          {
            size_t e (c.find (L';', b));
            if (e == wstring::npos)
              e = c.size ();

            if (iequal (c.substr (b, e - b), wd))
            {
              found = true;
              break;
            }

            b = e + 1;
          }

          if (found)
          {
            r.unchanged.push_back ({"PATH", d, d + " is already in PATH"});
            continue;
          }

          k.set (L"Path", c.empty () ? wd : c + L';' + wd, REG_EXPAND_SZ);
          r.applied.push_back ({"PATH", d, "added " + d + " to PATH"});
        }

        if (!r.applied.empty ())
          broadcast_environment_change ();

        return r;
      }
    };

    class windows_services: public platform_services
    {
    public:
      windows_services ()
      {
        fs::path h (home_directory ());
        optional<fs::path> a;

        if (const char* v = getenv ("APPDATA"))
          a = fs::path (v);

        paths_ = windows_paths (h, a);
      }

      string
      name () const override
      {
        return "Windows";
      }

      bool
      supported () const override
      {
        return true;
      }

      string
      platform_key () const override
      {
        return current_platform_key ();
      }

      string
      binary_name () const override
      {
        return current_binary_name ();
      }

      const platform_paths&
      paths () const override
      {
        return paths_;
      }

      string
      bundle_name () const override
      {
        return "WIN";
      }

      fs::path
      bundle_editor_settings () const override
      {
        return fs::path ("AppData") / "Roaming" / "Code" / "User" /
               "settings.json";
      }

      vector<fs::path>
      editor_locations () const override
      {
        vector<fs::path> r {
          "C:\\Program Files\\Microsoft VS Code\\Code.exe",
          "C:\\Program Files (x86)\\Microsoft VS Code\\Code.exe"};

        if (const char* v = getenv ("LOCALAPPDATA"))
          r.push_back (fs::path (v) / "Programs" / "Microsoft VS Code" /
                       "Code.exe");

        return r;
      }

      void
      print_install_instructions (ostream& o) const override
      {
        o << "Please install the missing software via Software Center:\n"
          << "\n"
          << "  1. Open Software Center from the Start menu\n"
          << "  2. Search for and install:\n"
          << "     - Visual Studio Code\n"
          << "     - Git for Windows\n"
          << "\n"
          << "Once installed, run this command again." << endl;
      }

      environment_writer&
      environment () override
      {
        return writer_;
      }

    private:
      platform_paths paths_;
      registry_environment_writer writer_;
    };
  }

  unique_ptr<platform_services>
  make_platform_services ()
  {
    return make_unique<windows_services> ();
  }
}

#endif
