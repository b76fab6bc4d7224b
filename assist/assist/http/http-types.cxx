#include <assist/http/http-types.hxx>

#include <stdexcept>

using namespace std;

namespace assist
{
  string url_parts::
  origin () const
  {
    string r (scheme + "://" + host);

    if (!default_port ())
      r += ':' + port;

    return r;
  }

  url_parts
  parse_url (const string& u)
  {
    // A scheme-less URL is most likely a relative path that slipped in
    // through --bucket, so don't guess.
    //
    string::size_type p (u.find ("://"));
    if (p == string::npos)
      throw invalid_argument ("missing URL scheme: " + u);

    url_parts r;
    r.scheme = u.substr (0, p);

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("unsupported URL scheme: " + r.scheme);

    // The authority ends at the first slash, query, or the end of string.
    //
    string::size_type b (p + 3);
    string::size_type e (u.find_first_of ("/?", b));
    if (e == string::npos)
      e = u.size ();

    string a (u, b, e - b);
    string::size_type c (a.find (':'));

    r.host = a.substr (0, c);
    r.port = c != string::npos
      ? a.substr (c + 1)
      : string (r.secure () ? "443" : "80");

    if (r.host.empty ())
      throw invalid_argument ("missing host in URL: " + u);

    if (r.port.empty ())
      throw invalid_argument ("empty port in URL: " + u);

    if (e == u.size ())
      r.target = "/";
    else if (u[e] == '?')
      r.target = '/' + u.substr (e);
    else
      r.target = u.substr (e);

    return r;
  }
}
