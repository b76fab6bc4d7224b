#include <assist/assist-fetch.hxx>

#include <cstdio>
#include <iostream>

#ifdef _WIN32
#  include <io.h>
#else
#  include <unistd.h>
#endif

#include <assist/progress/progress-renderer.hxx>
#include <assist/progress/progress-tracker.hxx>

using namespace std;

namespace assist
{
  // Download progress line.
  //
  struct fetch_coordinator::reporter
  {
    explicit
    reporter (bool e)
      : renderer (cout), enabled (e) {}

    void
    progress (uint64_t b, uint64_t t)
    {
      if (enabled && tracker.update (b, t))
        renderer.show (label, tracker.snapshot ());
    }

    // Draw the final state and end the line so that regular output can
    // follow.
    //
    void
    done ()
    {
      if (renderer.active ())
      {
        tracker.finish ();
        renderer.show (label, tracker.snapshot ());
        renderer.finish ();
      }

      tracker.reset ();
    }

    progress_tracker tracker;
    progress_renderer renderer;
    bool enabled;
    string label;
    string target;
  };

  static http_client_traits<>
  client_traits (const fetch_settings& s)
  {
    http_client_traits<> t;
    t.ssl_cert_file = s.ca_file;
    return t;
  }

  fetch_coordinator::
  fetch_coordinator (asio::io_context& ioc, fetch_settings s)
    : settings_ (move (s)),
      http_ (ioc, client_traits (settings_)),
      remote_ (http_, settings_.bucket),
      local_ (settings_.local_dir),
      runner_ (ioc),
      fetcher_ (remote_, local_, runner_, settings_.download_dir),
      reporter_ (make_unique<reporter> (settings_.progress &&
                                        stdout_terminal ()))
  {
    reporter_->label = "  " + settings_.binary;

    fetcher_.on_progress ([this] (uint64_t b, uint64_t t)
    {
      reporter_->progress (b, t);
    });

    fetcher_.on_fallback ([this] (fetch_state s, const string& c)
    {
      reporter_->done ();

      cout << "  remote unavailable while " << s
           << ", using local fallback store" << endl;

      if (settings_.verbose)
        cout << "  remote failure: " << c << endl;
    });

    fetcher_.on_warning ([this] (const string& m)
    {
      reporter_->done ();
      cerr << "warning: " << m << endl;
    });

    fetcher_.on_state ([this] (fetch_state s)
    {
      const fetch_settings& c (settings_);
      const string& t (reporter_->target);

      switch (s)
      {
      case fetch_state::resolving_version:
        cout << "Resolving " << t << endl;
        break;
      case fetch_state::fetching_manifest:
        cout << "Fetching release manifest" << endl;
        break;
      case fetch_state::selecting_platform:
        if (c.verbose)
          cout << "  platform " << c.platform << endl;
        break;
      case fetch_state::downloading:
        cout << "Downloading " << c.binary << " for " << c.platform << endl;
        break;
      case fetch_state::verifying:
        reporter_->done ();
        cout << "Verifying checksum" << endl;
        break;
      case fetch_state::installing:
        cout << "Running installer" << endl;
        if (c.verbose)
          cout << "  " << c.binary << ' '
               << artifact_fetcher::traits::install_command << ' ' << t
               << endl;
        break;
      case fetch_state::cleanup:
        if (c.verbose)
          cout << "  removing downloaded installer" << endl;
        break;
      case fetch_state::done:
      case fetch_state::failed:
        reporter_->done ();
        break;
      case fetch_state::idle:
        break;
      }
    });
  }

  fetch_coordinator::
  ~fetch_coordinator () = default;

  asio::awaitable<install_outcome> fetch_coordinator::
  install (const install_target& t)
  {
    reporter_->target = t.text;

    if (settings_.verbose)
    {
      cout << "  remote store " << remote_.base_url () << '\n'
           << "  local store " << local_.root ().string () << '\n'
           << "  download directory " << settings_.download_dir.string ()
           << endl;
    }

    co_return co_await fetcher_.install (t,
                                         settings_.platform,
                                         settings_.binary);
  }

  bool
  stdout_terminal () noexcept
  {
#ifdef _WIN32
    return _isatty (_fileno (stdout)) != 0;
#else
    return isatty (fileno (stdout)) != 0;
#endif
  }
}
