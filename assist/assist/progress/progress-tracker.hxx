#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <assist/progress/progress-types.hxx>

namespace assist
{
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // Speed is recomputed at most this often.
    //
    static constexpr std::uint64_t min_update_interval_ms = 100;

    // Weight of the latest sample in the speed average.
    //
    static constexpr float ewma_alpha = 0.3f;

    // 1.5 MiB
    //
    static string_type
    format_bytes (std::uint64_t);

    // 1.5 MiB/s
    //
    static string_type
    format_speed (float bytes_per_second);

    // 01m05s, 1h02m03s
    //
    static string_type
    format_duration (int seconds);

    // [=====>    ], or a fixed marker if the total is unknown.
    //
    static string_type
    format_bar (float ratio, bool indeterminate, int width);
  };

  // Download speed estimate fed from the transfer's progress callback.
  //
  // Speed is an exponentially weighted average of the rate between samples
  // at least min_update_interval_ms apart, so that chunk-sized bursts do
  // not make the number jump around.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using clock_type  = std::chrono::steady_clock;

    // Return true if this sample was taken into the average and is thus
    // worth redrawing for.
    //
    bool
    update (std::uint64_t bytes, std::uint64_t total);

    // Mark complete. The next snapshot reports a ratio of 1.
    //
    void
    finish () noexcept;

    void
    reset () noexcept;

    const progress_snapshot&
    snapshot () const noexcept
    {
      return s_;
    }

  private:
    progress_snapshot s_;

    std::uint64_t sample_bytes_ = 0;
    std::optional<clock_type::time_point> sample_time_;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <assist/progress/progress-tracker.ixx>
#include <assist/progress/progress-tracker.txx>
