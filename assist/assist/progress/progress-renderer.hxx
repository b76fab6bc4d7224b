#pragma once

#include <ostream>
#include <string>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <assist/progress/progress-types.hxx>
#include <assist/progress/progress-tracker.hxx>

namespace assist
{
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    static constexpr int default_bar_width = 20;

    // <label>            42% [========>    ] 12.0 MiB / 30.0 MiB  3.1 MiB/s 00m06s
    //
    static ftxui::Element
    render_line (const string_type& label,
                 const progress_snapshot&,
                 int bar_width = default_bar_width);
  };

  // Single-line progress display redrawn in place.
  //
  // Unlike a full-screen UI this leaves regular output above it intact, so
  // it can be interleaved with the installer's step messages: call finish()
  // before printing anything else.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_renderer (std::ostream&);

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    // Redraw the line.
    //
    void
    show (const string_type& label, const progress_snapshot&);

    // Move past the line, if one was drawn.
    //
    void
    finish ();

    bool
    active () const noexcept
    {
      return active_;
    }

  private:
    std::ostream& os_;
    std::string reset_;
    bool active_ = false;
  };

  using progress_renderer = basic_progress_renderer<>;
}

#include <assist/progress/progress-renderer.txx>
