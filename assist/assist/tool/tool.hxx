#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>

#include <assist/fetch/fetch-types.hxx>

namespace assist
{
  namespace asio = boost::asio;

  // Installable tool.
  //
  // Each operation reports progress on stdout and throws on failure (a
  // fetch_error for the install pipeline, std::runtime_error otherwise).
  //
  class tool
  {
  public:
    virtual
    ~tool () = default;

    // Registry key, for example claude-code.
    //
    virtual std::string
    name () const = 0;

    virtual std::string
    display_name () const = 0;

    virtual bool
    installed () const = 0;

    virtual asio::awaitable<void>
    install (const install_target&) = 0;

    // Not being installed is not an error.
    //
    virtual asio::awaitable<void>
    uninstall () = 0;

    // Deploy the organization's configuration for this tool.
    //
    virtual void
    configure () = 0;
  };
}
