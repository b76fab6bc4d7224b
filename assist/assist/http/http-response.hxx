#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <assist/http/http-types.hxx>

namespace assist
{
  // Buffered HTTP response.
  //
  template <typename S, typename B = S>
  struct basic_http_response
  {
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    std::uint16_t            status = 0;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    std::uint16_t
    status_code () const noexcept
    {
      return status;
    }

    bool
    is_success () const noexcept
    {
      return status >= 200 && status < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status >= 300 && status < 400;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get (string_type ("Location"));
    }
  };

  using http_response = basic_http_response<std::string>;
}
