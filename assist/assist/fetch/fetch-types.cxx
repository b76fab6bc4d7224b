#include <assist/fetch/fetch-types.hxx>

#include <cctype>
#include <limits>

using namespace std;

namespace assist
{
  // Parse an unsigned decimal without leading zeros. Return nullopt if we
  // are at the end, looking at garbage, or the value overflows.
  //
  static optional<uint64_t>
  parse_u64 (const string& s, size_t& p)
  {
    if (p >= s.size () || !isdigit (static_cast<unsigned char> (s[p])))
      return nullopt;

    size_t b (p);
    uint64_t r (0);
    while (p < s.size () && isdigit (static_cast<unsigned char> (s[p])))
    {
      uint64_t d (static_cast<uint64_t> (s[p] - '0'));

      if (r > (numeric_limits<uint64_t>::max () - d) / 10)
        return nullopt;

      r = r * 10 + d;
      ++p;
    }

    if (s[b] == '0' && p - b > 1)
      return nullopt;

    return r;
  }

  static bool
  parse_c (const string& s, size_t& p, char c)
  {
    if (p < s.size () && s[p] == c)
    {
      ++p;
      return true;
    }
    return false;
  }

  // Dot-separated, non-empty identifiers of [0-9A-Za-z-].
  //
  static bool
  valid_pre_release (const string& s)
  {
    if (s.empty ())
      return false;

    size_t n (0); // Current identifier length.
    for (char c : s)
    {
      if (c == '.')
      {
        if (n == 0)
          return false;

        n = 0;
      }
      else if (isalnum (static_cast<unsigned char> (c)) || c == '-')
        ++n;
      else
        return false;
    }

    return n != 0;
  }

  string semantic_version::
  string () const
  {
    std::string r (std::to_string (major) + '.' +
                   std::to_string (minor) + '.' +
                   std::to_string (patch));

    if (!pre_release.empty ())
      r += '-' + pre_release;

    return r;
  }

  optional<semantic_version>
  parse_semantic_version (const std::string& s)
  {
    size_t p (0);

    auto mj (parse_u64 (s, p));
    if (!mj || !parse_c (s, p, '.')) return nullopt;

    auto mi (parse_u64 (s, p));
    if (!mi || !parse_c (s, p, '.')) return nullopt;

    auto pa (parse_u64 (s, p));
    if (!pa) return nullopt;

    semantic_version v;
    v.major = *mj;
    v.minor = *mi;
    v.patch = *pa;

    if (p == s.size ())
      return v;

    if (!parse_c (s, p, '-'))
      return nullopt;

    std::string pr (s.substr (p));
    if (!valid_pre_release (pr))
      return nullopt;

    v.pre_release = move (pr);
    return v;
  }

  string
  to_string (release_channel c)
  {
    switch (c)
    {
      case release_channel::latest: return "latest";
      case release_channel::stable: return "stable";
    }
    return "latest";
  }

  optional<install_target>
  parse_install_target (const string& s)
  {
    install_target r;
    r.text = s;

    if (s == "latest")
      r.channel = release_channel::latest;
    else if (s == "stable")
      r.channel = release_channel::stable;
    else if (auto v = parse_semantic_version (s))
      r.version = move (*v);
    else
      return nullopt;

    return r;
  }

  string
  to_string (artifact_source s)
  {
    switch (s)
    {
      case artifact_source::requested:      return "requested";
      case artifact_source::remote:         return "remote";
      case artifact_source::local_fallback: return "local fallback";
    }
    return "unknown";
  }

  string
  to_string (fetch_state s)
  {
    switch (s)
    {
      case fetch_state::idle:               return "idle";
      case fetch_state::resolving_version:  return "resolving version";
      case fetch_state::fetching_manifest:  return "fetching manifest";
      case fetch_state::selecting_platform: return "selecting platform";
      case fetch_state::downloading:        return "downloading";
      case fetch_state::verifying:          return "verifying";
      case fetch_state::installing:         return "installing";
      case fetch_state::cleanup:            return "cleanup";
      case fetch_state::done:               return "done";
      case fetch_state::failed:             return "failed";
    }
    return "unknown";
  }

  string
  pointer_path (release_channel c)
  {
    return to_string (c);
  }

  string
  manifest_path (const string& v)
  {
    return v + "/manifest.json";
  }

  string
  binary_path (const string& v, const string& p, const string& b)
  {
    return v + '/' + p + '/' + b;
  }

  string
  artifact_file_name (const string& v, const string& p, const string& b)
  {
    fs::path bp (b);
    std::string r (bp.stem ().string () + '-' + v + '-' + p);

    if (bp.has_extension ())
      r += bp.extension ().string ();

    return r;
  }
}
