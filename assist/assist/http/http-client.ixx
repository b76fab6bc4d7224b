namespace assist
{
  template <typename T>
  inline basic_http_session<T>::
  basic_http_session (asio::io_context& ioc, const traits_type& t)
    : ioc_ (ioc), traits_ (t), ssl_ctx_ (ssl::context::tlsv12_client)
  {
    if (traits_.ssl_cert_file.empty ())
      load_system_certificates (ssl_ctx_);
    else
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    co_return co_await get_impl (url, 0);
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const string_type& url,
            const string_type& file,
            progress_callback progress)
  {
    co_return co_await download_impl (url, file, progress, 0);
  }
}
