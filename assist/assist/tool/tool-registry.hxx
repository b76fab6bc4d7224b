#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <assist/tool/tool.hxx>

namespace assist
{
  // Tools by name.
  //
  class tool_registry
  {
  public:
    using map_type = std::map<std::string, std::unique_ptr<tool>>;
    using const_iterator = map_type::const_iterator;

    tool_registry () = default;

    tool_registry (const tool_registry&) = delete;
    tool_registry& operator= (const tool_registry&) = delete;

    // Throw std::invalid_argument if a tool with this name is already
    // registered.
    //
    tool&
    add (std::unique_ptr<tool>);

    // Return nullptr if not found.
    //
    tool*
    find (const std::string& name) const noexcept;

    // Throw std::runtime_error listing the known tools if not found.
    //
    tool&
    get (const std::string& name) const;

    std::vector<std::string>
    names () const;

    bool
    empty () const noexcept
    {
      return tools_.empty ();
    }

    const_iterator
    begin () const noexcept
    {
      return tools_.begin ();
    }

    const_iterator
    end () const noexcept
    {
      return tools_.end ();
    }

  private:
    map_type tools_;
  };
}
