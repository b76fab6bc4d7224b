#include <iomanip>
#include <sstream>

namespace assist
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_line (const string_type& label, const progress_snapshot& s, int w)
  {
    using namespace ftxui;
    using traits = progress_tracker_traits<S>;

    // Unknown size gets a static marker rather than a made-up percentage.
    //
    bool i (s.total_bytes == 0 && !s.finished);
    float p (s.progress_ratio ());
    int pct (static_cast<int> (p * 100));

    // Fixed widths so that the line does not jitter as the numbers change.
    //
    std::ostringstream r;
    if (!i)
      r << std::right << std::setw (4) << pct << "% ";

    r << traits::format_bar (p, i, w)
      << " " << std::setw (10) << traits::format_bytes (s.current_bytes);

    if (s.total_bytes != 0)
      r << " / " << std::setw (10) << std::left
        << traits::format_bytes (s.total_bytes) << std::right;

    r << " " << std::setw (11) << traits::format_speed (s.speed);

    int eta (s.eta_seconds ());
    if (eta > 0)
      r << " " << traits::format_duration (eta);

    Element st (text (r.str ()));
    if (s.finished)
      st = st | color (Color::Green);

    return hbox ({
      text (label),
      filler (),
      st
    });
  }

  template <typename T>
  basic_progress_renderer<T>::
  basic_progress_renderer (std::ostream& o)
    : os_ (o)
  {
  }

  template <typename T>
  void basic_progress_renderer<T>::
  show (const string_type& label, const progress_snapshot& s)
  {
    using namespace ftxui;

    Element e (traits_type::render_line (label, s));

    auto screen (Screen::Create (Dimension::Full (), Dimension::Fixed (1)));
    Render (screen, e);

    os_ << reset_ << screen.ToString () << std::flush;

    reset_ = screen.ResetPosition ();
    active_ = true;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    if (!active_)
      return;

    os_ << std::endl;
    reset_.clear ();
    active_ = false;
  }
}
