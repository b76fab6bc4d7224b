#include <assist/config/config-deployer.hxx>

#include <algorithm>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace assist
{
  const vector<string> config_deployer::root_certificates {
    "ZscalerRootCertificate-2048-SHA256.crt",
    "zscaler-root.crt"};

  config_deployer::
  config_deployer (const platform_paths& p,
                   fs::path b,
                   fs::path e,
                   environment_writer& w)
    : paths_ (p),
      bundle_ (move (b)),
      editor_settings_ (move (e)),
      writer_ (w)
  {
  }

  deploy_report config_deployer::
  deploy ()
  {
    deploy_report r;

    error_code ec;
    if (!fs::is_directory (bundle_, ec))
      return r;

    r.bundle_found = true;

    r.items.push_back (deploy_claude_settings ());
    r.certificates = deploy_certificates ();
    r.items.push_back (deploy_editor_settings ());

    environment_snapshot s (desired_environment (environment_snapshot ()));
    if (!s.empty ())
      r.environment = writer_.apply (s);

    return r;
  }

  environment_snapshot config_deployer::
  desired_environment (const environment_snapshot& b) const
  {
    for (const string& n : root_certificates)
    {
      fs::path c (paths_.certs_dir / n);

      error_code ec;
      if (fs::is_regular_file (c, ec))
        return b.with_variable ("NODE_EXTRA_CA_CERTS", c.string ());
    }

    return b;
  }

  deploy_item config_deployer::
  deploy_claude_settings ()
  {
    fs::path s (bundle_ / ".claude" / "settings.json");
    fs::path t (paths_.claude_dir / "settings.json");

    return deploy_item {"Claude settings", t, deploy_settings (s, t)};
  }

  vector<string> config_deployer::
  deploy_certificates ()
  {
    vector<string> r;

    for (const fs::path& d : {bundle_ / ".continue" / "certs",
                              bundle_ / "certs"})
    {
      error_code ec;
      if (!fs::is_directory (d, ec))
        continue;

      // Sort so that the result does not depend on the directory order.
      //
      vector<fs::path> cs;
      for (const fs::directory_entry& e : fs::directory_iterator (d))
      {
        const fs::path& p (e.path ());
        string n (p.filename ().string ());

        // Skip macOS resource forks (._foo.crt) from archives made on a Mac.
        //
        if (n.compare (0, 2, "._") == 0)
          continue;

        if (p.extension () == ".crt" && e.is_regular_file ())
          cs.push_back (p);
      }

      if (cs.empty ())
        continue;

      sort (cs.begin (), cs.end ());

      fs::create_directories (paths_.certs_dir, ec);
      if (ec)
        throw runtime_error ("unable to create " +
                             paths_.certs_dir.string () + ": " + ec.message ());

      for (const fs::path& c : cs)
      {
        fs::path t (paths_.certs_dir / c.filename ());
        fs::copy_file (c, t, fs::copy_options::overwrite_existing, ec);

        if (ec)
          throw runtime_error ("unable to copy " + c.string () + " to " +
                               t.string () + ": " + ec.message ());

        r.push_back (c.filename ().string ());
      }
    }

    return r;
  }

  deploy_item config_deployer::
  deploy_editor_settings ()
  {
    fs::path t (paths_.editor_settings_dir / "settings.json");

    error_code ec;
    fs::path s (bundle_ / editor_settings_);

    if (!fs::exists (s, ec))
      s = bundle_ / "vscode-settings.json";

    return deploy_item {"VS Code settings", t, deploy_settings (s, t)};
  }
}
