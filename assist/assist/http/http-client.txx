#include <chrono>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace assist
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Resolve a Location value against the URL it came from. Storage
  // frontends send both absolute and origin-relative forms.
  //
  inline std::string
  resolve_location (const url_parts& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    return base.origin () + (loc.empty () || loc[0] != '/' ? "/" : "") + loc;
  }

  template <typename T>
  template <typename R, typename F>
  asio::awaitable<R> basic_http_client<T>::
  with_stream (const url_parts& u, F f)
  {
    using std::chrono::milliseconds;

    asio::io_context& ctx (session_->io_context ());
    const traits_type& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto eps (co_await rslv.async_resolve (u.host,
                                           u.port,
                                           asio::use_awaitable));

    beast::error_code ec;

    if (!u.secure ())
    {
      beast::tcp_stream s (ctx);
      s.expires_after (milliseconds (tr.connect_timeout));
      co_await s.async_connect (eps, asio::use_awaitable);

      R r (co_await f (s));

      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }

    beast::ssl_stream<beast::tcp_stream> s (ctx, session_->ssl_context ());

    // SNI has to be set through OpenSSL directly. Storage frontends serve
    // a default certificate without it.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
      throw beast::system_error (
        beast::error_code (static_cast<int> (::ERR_get_error ()),
                           asio::error::get_ssl_category ()),
        "unable to set TLS server name");

    if (tr.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    beast::tcp_stream& l (beast::get_lowest_layer (s));
    l.expires_after (milliseconds (tr.connect_timeout));

    co_await l.async_connect (eps, asio::use_awaitable);
    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);

    R r (co_await f (s));

    // Servers commonly drop the connection instead of answering
    // close_notify, so do not wait for it.
    //
    l.socket ().shutdown (tcp::socket::shutdown_both, ec);
    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<void> basic_http_client<T>::
  write_request (Stream& s, const url_parts& u, const string_type& url)
  {
    const traits_type& tr (session_->traits ());

    request_type rq (url);
    rq.normalize (tr.user_agent);

    http::request<http::empty_body> m (http::verb::get, u.target, 11);

    for (const auto& h : rq.headers)
      m.set (h.first, h.second);

    beast::get_lowest_layer (s).expires_after (
      std::chrono::milliseconds (tr.request_timeout));

    co_await http::async_write (s, m, asio::use_awaitable);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get_impl (const string_type& url, std::uint8_t redirects)
  {
    const traits_type& tr (session_->traits ());

    if (redirects >= tr.max_redirects)
      throw std::runtime_error ("too many redirects fetching " + url);

    url_parts u (parse_url (url));

    auto exchange = [&] (auto& s) -> asio::awaitable<response_type>
    {
      co_await write_request (s, u, url);

      beast::flat_buffer b;
      http::response_parser<http::string_body> p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read (s, b, p, asio::use_awaitable);

      http::response<http::string_body>& m (p.get ());

      response_type r;
      r.status = static_cast<std::uint16_t> (m.result_int ());
      r.reason = string_type (m.reason ());

      for (const auto& h : m)
        r.headers.add (string_type (h.name_string ()),
                       string_type (h.value ()));

      if (!m.body ().empty ())
        r.body = std::move (m.body ());

      co_return r;
    };

    response_type r (co_await with_stream<response_type> (u, exchange));

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (std::optional<string_type> l = r.location ())
        co_return co_await get_impl (resolve_location (u, *l), redirects + 1);
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download_impl (const string_type& url,
                 const string_type& file,
                 const progress_callback& progress,
                 std::uint8_t redirects)
  {
    using std::chrono::milliseconds;

    const traits_type& tr (session_->traits ());

    if (redirects >= tr.max_redirects)
      throw std::runtime_error ("too many redirects fetching " + url);

    url_parts u (parse_url (url));

    std::uint64_t n (0);
    string_type next;

    // Return false if redirected, with next set to the new location.
    //
    auto transfer = [&] (auto& s) -> asio::awaitable<bool>
    {
      co_await write_request (s, u, url);

      beast::flat_buffer b;
      http::response_parser<http::buffer_body> p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      unsigned st (p.get ().result_int ());

      if (tr.follow_redirects && st >= 300 && st < 400)
      {
        beast::string_view l (p.get ()[http::field::location]);
        if (!l.empty ())
        {
          next = resolve_location (u, std::string (l));
          co_return false;
        }
      }

      if (st != 200)
        throw std::runtime_error ("HTTP " + std::to_string (st) + " " +
                                  std::string (p.get ().reason ()));

      std::ofstream ofs (file, std::ios::binary | std::ios::trunc);
      if (!ofs)
        throw std::runtime_error ("unable to open " + file + " for writing");

      std::uint64_t total (p.content_length () ? *p.content_length () : 0);
      beast::tcp_stream& l (beast::get_lowest_layer (s));

      char buf[16384];
      while (!p.is_done ())
      {
        p.get ().body ().data = buf;
        p.get ().body ().size = sizeof (buf);

        l.expires_after (milliseconds (tr.request_timeout));

        beast::error_code ec;
        co_await http::async_read_some (
          s, b, p, asio::redirect_error (asio::use_awaitable, ec));

        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec, "download interrupted");

        std::size_t k (sizeof (buf) - p.get ().body ().size);
        if (k == 0)
          continue;

        if (!ofs.write (buf, static_cast<std::streamsize> (k)))
          throw std::runtime_error ("unable to write " + file);

        n += k;

        if (progress)
          progress (n, total);
      }

      ofs.close ();
      if (!ofs)
        throw std::runtime_error ("unable to write " + file);

      co_return true;
    };

    if (!co_await with_stream<bool> (u, transfer))
      co_return co_await download_impl (next, file, progress, redirects + 1);

    co_return n;
  }
}
