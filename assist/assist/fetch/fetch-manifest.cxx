#include <assist/fetch/fetch-manifest.hxx>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/json.hpp>

using namespace std;

namespace assist
{
  namespace json = boost::json;

  static bool
  hex_digest (const string& s)
  {
    return s.size () == 64 &&
           all_of (s.begin (), s.end (),
                   [] (unsigned char c) {return isxdigit (c) != 0;});
  }

  // Throw std::invalid_argument if the entry is malformed.
  //
  static checksum_entry
  parse_entry (const string& platform, const json::value& v)
  {
    if (!v.is_object ())
      throw invalid_argument ("entry for " + platform + " must be an object");

    const json::object& o (v.as_object ());

    const json::value* c (o.if_contains ("checksum"));
    if (c == nullptr || !c->is_string ())
      throw invalid_argument ("entry for " + platform +
                              " has no checksum string");

    checksum_entry r;
    r.platform = platform;
    r.checksum = json::value_to<string> (*c);

    if (!hex_digest (r.checksum))
      throw invalid_argument ("checksum for " + platform +
                              " is not a hex SHA-256 digest");

    transform (r.checksum.begin (), r.checksum.end (), r.checksum.begin (),
               [] (unsigned char ch) {return static_cast<char> (tolower (ch));});

    if (const json::value* s = o.if_contains ("size"))
    {
      if (s->is_uint64 ())
        r.size = s->as_uint64 ();
      else if (s->is_int64 () && s->as_int64 () >= 0)
        r.size = static_cast<uint64_t> (s->as_int64 ());
      else
        throw invalid_argument ("size for " + platform +
                                " is not a non-negative integer");
    }

    return r;
  }

  release_manifest
  parse_release_manifest (const string& text)
  {
    try
    {
      boost::system::error_code ec;
      json::value jv (json::parse (text, ec));

      if (ec)
        throw invalid_argument (ec.message ());

      if (!jv.is_object ())
        throw invalid_argument ("manifest JSON must be an object");

      const json::object& obj (jv.as_object ());

      release_manifest m;

      if (const json::value* v = obj.if_contains ("version"))
      {
        if (!v->is_string ())
          throw invalid_argument ("version must be a string");

        m.version = json::value_to<string> (*v);
      }

      const json::value* ps (obj.if_contains ("platforms"));
      if (ps == nullptr || !ps->is_object ())
        throw invalid_argument ("platforms object is missing");

      // Entries are validated on selection.
      //
      for (const auto& kv : ps->as_object ())
        m.platforms.emplace (string (kv.key ().data (), kv.key ().size ()),
                             kv.value ());

      return m;
    }
    catch (const invalid_argument& e)
    {
      throw manifest_error (string ("malformed manifest: ") + e.what ());
    }
  }

  checksum_entry
  select_platform_entry (const release_manifest& m, const string& p)
  {
    auto i (m.platforms.find (p));

    if (i == m.platforms.end ())
      throw unsupported_platform_error (p);

    try
    {
      return parse_entry (p, i->second);
    }
    catch (const invalid_argument& e)
    {
      throw manifest_error (string ("malformed manifest: ") + e.what ());
    }
  }
}
