#pragma once

#include <string>
#include <utility>

#include <assist/http/http-types.hxx>

namespace assist
{
  // GET request. That is all an object store needs from us.
  //
  template <typename S>
  struct basic_http_request
  {
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    string_type  url;
    headers_type headers;

    explicit
    basic_http_request (string_type u)
        : url (std::move (u)) {}

    // Add Host, User-Agent, and Accept unless already present.
    //
    void
    normalize (const string_type& user_agent);
  };

  using http_request = basic_http_request<std::string>;
}

#include <assist/http/http-request.ixx>
