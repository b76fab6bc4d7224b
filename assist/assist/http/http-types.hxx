#pragma once

#include <string>
#include <utility>
#include <optional>
#include <vector>

namespace assist
{
  // Header fields in the order received. Lookups are case-insensitive as
  // per RFC 7230 and return the first match.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = std::pair<string_type, string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace all fields with this name.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value)
    {
      fields.emplace_back (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_headers = basic_http_headers<std::string>;

  // Parsed URL.
  //
  // Only the scheme://host[:port][/target] shape of object store URLs is
  // handled. No user info, no IPv6 literals.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    bool
    default_port () const noexcept
    {
      return port == (secure () ? "443" : "80");
    }

    // scheme://host[:port] with the port omitted if it is the default.
    //
    std::string
    origin () const;
  };

  // Throw std::invalid_argument if the scheme is not http or https or the
  // host is empty.
  //
  url_parts
  parse_url (const std::string&);
}

#include <assist/http/http-types.ixx>
