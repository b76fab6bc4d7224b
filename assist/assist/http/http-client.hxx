#pragma once

#include <string>
#include <memory>
#include <functional>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <assist/http/http-types.hxx>
#include <assist/http/http-request.hxx>
#include <assist/http/http-response.hxx>

namespace assist
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Milliseconds to resolve, connect, and complete the TLS handshake.
    //
    std::uint32_t connect_timeout = 30000;

    // Milliseconds without progress on a request. Downloads re-arm it on
    // every chunk so a slow but steady transfer is fine.
    //
    std::uint32_t request_timeout = 60000;

    std::uint8_t max_redirects = 10;
    bool follow_redirects = true;

    bool verify_ssl = true;

    // PEM bundle to trust instead of the system store, for example the
    // root of a TLS-inspecting proxy.
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("code-assist");
  };

  // Add the platform's trusted root certificates to the context. On
  // Windows these come from the system ROOT store.
  //
  void
  load_system_certificates (ssl::context&);

  // TLS context and configuration shared by the requests of one client.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context&, const traits_type&);

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // GET-only HTTP/1.1 client.
  //
  // Every call opens its own connection (TLS for https) and closes it when
  // done. Redirects are followed up to traits::max_redirects.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // (bytes so far, total). The total is 0 without Content-Length.
    //
    using progress_callback = std::function<void (std::uint64_t,
                                                  std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Return the final response with the body buffered, whatever its
    // status.
    //
    asio::awaitable<response_type>
    get (const string_type& url);

    // Stream the body into the file, truncating it once the response
    // headers arrive. Return the number of bytes written.
    //
    // Throw std::runtime_error unless the final status is 200. What was
    // written so far is left for the caller to remove.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const string_type& file,
              progress_callback progress = nullptr);

  private:
    asio::awaitable<response_type>
    get_impl (const string_type& url, std::uint8_t redirects);

    asio::awaitable<std::uint64_t>
    download_impl (const string_type& url,
                   const string_type& file,
                   const progress_callback& progress,
                   std::uint8_t redirects);

    // Connect to the URL's origin and co_await f (stream). The connection
    // is shut down after f returns.
    //
    template <typename R, typename F>
    asio::awaitable<R>
    with_stream (const url_parts&, F f);

    // Send GET for the URL on the stream.
    //
    template <typename Stream>
    asio::awaitable<void>
    write_request (Stream&, const url_parts&, const string_type& url);

    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <assist/http/http-client.ixx>
#include <assist/http/http-client.txx>
