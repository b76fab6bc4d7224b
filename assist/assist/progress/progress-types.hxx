#pragma once

#include <cstdint>

namespace assist
{
  // Point-in-time view of a transfer.
  //
  struct progress_snapshot
  {
    std::uint64_t current_bytes = 0;
    std::uint64_t total_bytes = 0;  // 0 if the server did not say.
    float speed = 0.0f;             // Bytes per second.
    bool finished = false;

    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return finished ? 1.0f : 0.0f;

      float r (static_cast<float> (current_bytes) /
               static_cast<float> (total_bytes));

      return r > 1.0f ? 1.0f : r;
    }

    // Estimated seconds remaining or -1 if unknown.
    //
    int
    eta_seconds () const noexcept
    {
      if (total_bytes == 0 || speed <= 0.0f || current_bytes >= total_bytes)
        return -1;

      return static_cast<int> (
        static_cast<float> (total_bytes - current_bytes) / speed);
    }
  };
}
