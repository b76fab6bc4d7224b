#include <assist/assist-http.hxx>

#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace assist
{
  string
  format_http_error (const http_response& r)
  {
    ostringstream o;
    o << "HTTP " << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    // Append the start of the body since object stores explain themselves
    // there (e.g., <Code>NoSuchKey</Code>), but cap it so a whole HTML
    // error page does not end up in a one-line diagnostic.
    //
    if (r.body && !r.body->empty ())
    {
      const string& b (*r.body);
      const size_t m (200);

      string s (b.size () <= m ? b : b.substr (0, m) + "...");
      for (char& c : s)
        if (c == '\n' || c == '\r')
          c = ' ';

      o << ": " << s;
    }

    return o.str ();
  }

  http_coordinator::
  http_coordinator (asio::io_context& i)
    : client_ (make_unique<client_type> (i))
  {
  }

  http_coordinator::
  http_coordinator (asio::io_context& i, const http_client_traits<>& t)
    : client_ (make_unique<client_type> (i, t))
  {
  }

  asio::awaitable<string> http_coordinator::
  get (const string& u)
  {
    response_type r (co_await client_->get (u));

    // A redirect we could not follow ends up here too.
    //
    if (!r.is_success ())
      throw runtime_error (format_http_error (r));

    if (!r.body)
      co_return string ();

    co_return *r.body;
  }

  asio::awaitable<uint64_t> http_coordinator::
  download_file (const string& u, const fs::path& t, progress_callback cb)
  {
    if (t.has_parent_path ())
    {
      error_code e;
      fs::create_directories (t.parent_path (), e);

      if (e)
        throw runtime_error ("unable to create " +
                             t.parent_path ().string () + ": " +
                             e.message ());
    }

    co_return co_await client_->download (u, t.string (), move (cb));
  }
}
