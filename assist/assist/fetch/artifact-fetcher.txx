#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <assist/fetch/fetch-digest.hxx>

namespace assist
{
  namespace fetch_detail
  {
    inline std::string
    trim_copy (const std::string& s)
    {
      const char* ws (" \t\r\n");

      std::string::size_type b (s.find_first_not_of (ws));
      if (b == std::string::npos)
        return std::string ();

      return s.substr (b, s.find_last_not_of (ws) - b + 1);
    }

    // Quote what we got for a diagnostic. Whatever sits in the pointer file
    // may well be an HTML error page.
    //
    inline std::string
    excerpt (const std::string& s)
    {
      return '\'' + (s.size () > 40 ? s.substr (0, 40) + "..." : s) + '\'';
    }

    // Throw e with the local failure nested and the remote failure nested
    // in turn.
    //
    template <typename E>
    [[noreturn]] void
    throw_fallback_failure (const E& e,
                            const std::string& remote,
                            const std::string& local)
    {
      try
      {
        throw std::runtime_error ("remote: " + remote);
      }
      catch (const std::runtime_error&)
      {
        try
        {
          std::throw_with_nested (std::runtime_error ("local fallback: " +
                                                      local));
        }
        catch (const std::runtime_error&)
        {
          std::throw_with_nested (e);
        }
      }
    }
  }

  template <typename T>
  basic_artifact_fetcher<T>::
  basic_artifact_fetcher (remote_type& r,
                          local_type& l,
                          runner_type& p,
                          fs::path d)
    : remote_ (r),
      local_ (l),
      runner_ (p),
      download_dir_ (std::move (d))
  {
  }

  template <typename T>
  asio::awaitable<resolved_version> basic_artifact_fetcher<T>::
  resolve_version (const install_target& t)
  {
    transition (fetch_state::resolving_version);

    if (t.version)
      co_return resolved_version {t.version->string (),
                                  artifact_source::requested};

    if (!t.channel)
      throw resolution_error ("invalid install target " +
                              fetch_detail::excerpt (t.text));

    const std::string rel (pointer_path (*t.channel));

    std::string text;
    std::string cause;
    bool remote (false);

    try
    {
      text = co_await remote_.fetch_text (rel);
      remote = true;
    }
    catch (const std::exception& e)
    {
      cause = e.what ();
    }

    artifact_source src (artifact_source::remote);

    if (!remote)
    {
      fallback (fetch_state::resolving_version, cause);

      try
      {
        text = local_.read_text (rel);
      }
      catch (const std::exception& e)
      {
        fetch_detail::throw_fallback_failure (
          resolution_error ("unable to resolve " + t.text +
                            " from remote or local fallback store"),
          cause,
          e.what ());
      }

      src = artifact_source::local_fallback;
    }

    // The pointer ends up in paths and URLs, so validate it first.
    //
    std::string v (fetch_detail::trim_copy (text));

    if (!parse_semantic_version (v))
      throw resolution_error (to_string (src) + " " + t.text +
                              " pointer is not a version: " +
                              fetch_detail::excerpt (v));

    co_return resolved_version {std::move (v), src};
  }

  template <typename T>
  asio::awaitable<fetched_manifest> basic_artifact_fetcher<T>::
  fetch_manifest (const resolved_version& v)
  {
    transition (fetch_state::fetching_manifest);

    const std::string rel (manifest_path (v.value));

    std::string text;
    std::string cause;
    bool remote (false);

    try
    {
      text = co_await remote_.fetch_text (rel);
      remote = true;
    }
    catch (const std::exception& e)
    {
      cause = e.what ();
    }

    artifact_source src (artifact_source::remote);

    if (!remote)
    {
      fallback (fetch_state::fetching_manifest, cause);

      try
      {
        text = local_.read_text (rel);
      }
      catch (const std::exception& e)
      {
        fetch_detail::throw_fallback_failure (
          manifest_error ("unable to fetch manifest for " + v.value +
                          " from remote or local fallback store"),
          cause,
          e.what ());
      }

      src = artifact_source::local_fallback;
    }

    fetched_manifest r {parse_release_manifest (text), src};

    if (!r.manifest.version.empty () && r.manifest.version != v.value)
      throw manifest_error (to_string (src) + " manifest is for version " +
                            r.manifest.version + ", not " + v.value);

    co_return r;
  }

  template <typename T>
  checksum_entry basic_artifact_fetcher<T>::
  select_platform_entry (const release_manifest& m, const std::string& p)
  {
    transition (fetch_state::selecting_platform);
    return assist::select_platform_entry (m, p);
  }

  template <typename T>
  asio::awaitable<verified_artifact> basic_artifact_fetcher<T>::
  download_and_verify (const resolved_version& v,
                       const std::string& p,
                       const std::string& b,
                       const checksum_entry& e)
  {
    transition (fetch_state::downloading);

    const std::string rel (binary_path (v.value, p, b));
    const fs::path f (download_dir_ / artifact_file_name (v.value, p, b));

    {
      std::error_code ec;
      fs::create_directories (download_dir_, ec);

      if (ec)
        throw download_error ("unable to create " + download_dir_.string () +
                              ": " + ec.message ());
    }

    std::string cause;
    bool remote (false);

    try
    {
      co_await remote_.fetch_file (rel, f, progress_cb_);
      remote = true;
    }
    catch (const std::exception& x)
    {
      cause = x.what ();
    }

    artifact_source src (artifact_source::remote);

    if (!remote)
    {
      remove_partial (f);
      fallback (fetch_state::downloading, cause);

      try
      {
        local_.copy_file (rel, f);
      }
      catch (const std::exception& x)
      {
        remove_partial (f);
        fetch_detail::throw_fallback_failure (
          download_error ("unable to download " + b + " " + v.value +
                          " for " + p + " from remote or local fallback store"),
          cause,
          x.what ());
      }

      src = artifact_source::local_fallback;
    }

    transition (fetch_state::verifying);

    std::uint64_t n (0);
    std::string h;

    try
    {
      n = fs::file_size (f);
      h = sha256_file (f);
    }
    catch (const std::exception&)
    {
      remove_partial (f);
      std::throw_with_nested (
        fetch_error (fetch_state::verifying,
                     "unable to verify " + f.filename ().string ()));
    }

    if (e.size && n != *e.size)
    {
      remove_partial (f);
      throw checksum_mismatch_error (
        "size mismatch for " + to_string (src) + " " + b + " " + v.value +
        ": expected " + std::to_string (*e.size) + " bytes, got " +
        std::to_string (n),
        std::to_string (*e.size),
        std::to_string (n));
    }

    if (!compare_digests (h, e.checksum))
    {
      remove_partial (f);
      throw checksum_mismatch_error (
        "checksum mismatch for " + to_string (src) + " " + b + " " + v.value +
        ": expected " + e.checksum + ", got " + h,
        e.checksum,
        h);
    }

    co_return verified_artifact {f, std::move (h), src};
  }

  template <typename T>
  asio::awaitable<int> basic_artifact_fetcher<T>::
  run_installer (const verified_artifact& a, const install_target& t)
  {
    transition (fetch_state::installing);

    // Remove the artifact when leaving, exception or not.
    //
    struct guard
    {
      basic_artifact_fetcher& f;
      const fs::path& p;
      bool active = true;

      void
      release ()
      {
        active = false;
        f.transition (fetch_state::cleanup);

        std::error_code ec;
        fs::remove (p, ec);

        if (ec)
          f.warn ("unable to remove " + p.string () + ": " + ec.message ());
      }

      ~guard ()
      {
        if (active)
          release ();
      }
    } g {*this, a.path};

    try
    {
      make_executable (a.path);
    }
    catch (const std::exception&)
    {
      std::throw_with_nested (
        installer_subprocess_error ("unable to make " + a.path.string () +
                                    " executable",
                                    -1));
    }

    std::vector<std::string> args {traits::install_command, t.text};
    int r (-1);

    try
    {
      r = co_await runner_.run (a.path, args);
    }
    catch (const std::exception&)
    {
      std::throw_with_nested (
        installer_subprocess_error ("unable to run " +
                                    a.path.filename ().string (),
                                    -1));
    }

    g.release ();
    co_return r;
  }

  template <typename T>
  asio::awaitable<install_outcome> basic_artifact_fetcher<T>::
  install (const install_target& t,
           const std::string& p,
           const std::string& b)
  {
    try
    {
      install_outcome o;

      o.version = co_await resolve_version (t);

      fetched_manifest m (co_await fetch_manifest (o.version));
      o.manifest_source = m.source;

      checksum_entry e (select_platform_entry (m.manifest, p));

      verified_artifact a (co_await download_and_verify (o.version, p, b, e));
      o.binary_source = a.source;

      o.exit_code = co_await run_installer (a, t);

      if (o.exit_code != 0)
        throw installer_subprocess_error (
          b + " install " + t.text + " exited with code " +
          std::to_string (o.exit_code),
          o.exit_code);

      transition (fetch_state::done);
      co_return o;
    }
    catch (const std::exception&)
    {
      transition (fetch_state::failed);
      throw;
    }
  }

  template <typename T>
  void basic_artifact_fetcher<T>::
  transition (fetch_state s)
  {
    state_ = s;

    if (state_cb_)
      state_cb_ (s);
  }

  template <typename T>
  void basic_artifact_fetcher<T>::
  fallback (fetch_state s, const std::string& c)
  {
    if (fallback_cb_)
      fallback_cb_ (s, c);
  }

  template <typename T>
  void basic_artifact_fetcher<T>::
  warn (const std::string& m)
  {
    if (warning_cb_)
      warning_cb_ (m);
  }

  template <typename T>
  void basic_artifact_fetcher<T>::
  remove_partial (const fs::path& f)
  {
    std::error_code ec;
    fs::remove (f, ec);

    if (ec)
      warn ("unable to remove partial " + f.string () + ": " + ec.message ());
  }
}
