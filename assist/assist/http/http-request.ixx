namespace assist
{
  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    // Host is required by HTTP/1.1. Keep a non-default port since a proxy
    // in front of the store may route on it.
    //
    if (!headers.contains (string_type ("Host")))
    {
      url_parts p (parse_url (url));
      headers.set (string_type ("Host"),
                   p.default_port () ? p.host : p.host + ':' + p.port);
    }

    if (!headers.contains (string_type ("User-Agent")))
      headers.set (string_type ("User-Agent"), ua);

    if (!headers.contains (string_type ("Accept")))
      headers.set (string_type ("Accept"), string_type ("*/*"));
  }
}
