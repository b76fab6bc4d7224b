#include <iomanip>
#include <sstream>

namespace assist
{
  namespace progress_detail
  {
    // Scale v by 1024 until it fits the unit or we run out of units. Plain
    // bytes are printed without decimals.
    //
    template <typename S, std::size_t N>
    S
    scaled (double v, const char* const (&units)[N], const char* suffix)
    {
      std::size_t i (0);
      for (; v >= 1024.0 && i + 1 != N; ++i)
        v /= 1024.0;

      std::ostringstream o;
      o << std::fixed << std::setprecision (i == 0 ? 0 : 1) << v << ' '
        << units[i] << suffix;

      return o.str ();
    }
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    static const char* const us[] = {"B", "KiB", "MiB", "GiB"};
    return progress_detail::scaled<S> (static_cast<double> (n), us, "");
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bps)
  {
    static const char* const us[] = {"B", "KiB", "MiB"};
    return progress_detail::scaled<S> (bps, us, "/s");
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    std::ostringstream o;

    if (s >= 3600)
      o << s / 3600 << 'h';

    o << std::setfill ('0')
      << std::setw (2) << s % 3600 / 60 << 'm'
      << std::setw (2) << s % 60 << 's';

    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    S b;

    if (ind)
      b = "<==>";
    else
    {
      int n (static_cast<int> (p * static_cast<float> (w)));

      if (n > 0)
        b = S (static_cast<std::size_t> (n - 1), '=') + '>';
    }

    if (static_cast<int> (b.size ()) < w)
      b.append (static_cast<std::size_t> (w) - b.size (), ' ');

    return '[' + b + ']';
  }

  template <typename T>
  bool basic_progress_tracker<T>::
  update (std::uint64_t n, std::uint64_t total)
  {
    using namespace std::chrono;

    s_.current_bytes = n;
    s_.total_bytes = total;

    clock_type::time_point now (clock_type::now ());

    if (!sample_time_)
    {
      sample_time_ = now;
      sample_bytes_ = n;
      return true;
    }

    duration<float> dt (now - *sample_time_);

    if (dt < milliseconds (traits_type::min_update_interval_ms))
      return false;

    float rate (static_cast<float> (n > sample_bytes_ ? n - sample_bytes_ : 0) /
                dt.count ());

    const float a (traits_type::ewma_alpha);
    s_.speed = s_.speed == 0.0f ? rate : a * rate + (1.0f - a) * s_.speed;

    sample_time_ = now;
    sample_bytes_ = n;
    return true;
  }
}
