#ifndef _WIN32

#include <assist/platform/platform.hxx>

using namespace std;

namespace assist
{
  namespace
  {
    class macos_services: public platform_services
    {
    public:
      macos_services ()
        : paths_ (macos_paths (home_directory ())) {}

      string
      name () const override
      {
        return "macOS";
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
        return "MACOS";
      }

      fs::path
      bundle_editor_settings () const override
      {
        return fs::path ("Library") / "Application Support" / "Code" /
               "User" / "settings.json";
      }

      vector<fs::path>
      editor_locations () const override
      {
        return {"/Applications/Visual Studio Code.app",
                paths_.home / "Applications" / "Visual Studio Code.app"};
      }

      void
      print_install_instructions (ostream& o) const override
      {
        o << "Please install the missing software via Self-Service:\n"
          << "\n"
          << "  1. Open Self-Service from your Applications folder or Dock\n"
          << "  2. Search for and install:\n"
          << "     - Visual Studio Code\n"
          << "     - Git (or Xcode Command Line Tools)\n"
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
      posix_environment_writer writer_;
    };

    // Development host. Everything works but nothing is distributed for it.
    //
    class linux_services: public platform_services
    {
    public:
      linux_services ()
        : paths_ (linux_paths (home_directory ())) {}

      string
      name () const override
      {
        return "Linux";
      }

      bool
      supported () const override
      {
        return false;
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
        return "LINUX";
      }

      fs::path
      bundle_editor_settings () const override
      {
        return fs::path (".config") / "Code" / "User" / "settings.json";
      }

      vector<fs::path>
      editor_locations () const override
      {
        return {"/usr/share/code/code",
                "/usr/bin/code",
                "/snap/bin/code"};
      }

      void
      print_install_instructions (ostream& o) const override
      {
        o << "Linux is not supported. Please use Windows or macOS." << endl;
      }

      environment_writer&
      environment () override
      {
        return writer_;
      }

    private:
      platform_paths paths_;
      posix_environment_writer writer_;
    };
  }

  unique_ptr<platform_services>
  make_platform_services ()
  {
#ifdef __APPLE__
    return make_unique<macos_services> ();
#else
    return make_unique<linux_services> ();
#endif
  }
}

#endif
