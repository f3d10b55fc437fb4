#pragma once

#include <chrono>
#include <string>
#include <cstdint>

namespace archeon
{
  // Formatting and sampling parameters.
  //
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // Weight of the newest sample in the speed average.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Samples closer together than this are dropped.
    //
    static constexpr std::uint64_t min_update_interval_ms = 100;

    // 512 B, 1.5 KiB, 3.2 MiB, ... up to TiB.
    //
    static string_type
    format_bytes (std::uint64_t);

    static string_type
    format_speed (float bytes_per_second);

    // 04m05s or 1h02m03s.
    //
    static string_type
    format_duration (int seconds);

    // [=====>    ] for the ratio p in [0, 1] over w cells. If ind is true,
    // render an indeterminate bar instead.
    //
    static string_type
    format_bar (float p, bool ind, int w);
  };

  // Transfer speed estimate.
  //
  // Speed is an exponentially weighted moving average over samples taken at
  // most every min_update_interval_ms. Not thread-safe: we only ever update
  // from the coroutine that moves the bytes.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    // Record that n bytes have been transferred so far. Return true if this
    // produced a new sample (and so is worth redrawing for).
    //
    bool
    update (std::uint64_t n) noexcept;

    // As above but at the specified time, in microseconds on an arbitrary
    // monotonic clock.
    //
    bool
    update (std::uint64_t n, std::uint64_t time_us) noexcept;

    // Current speed estimate in bytes per second.
    //
    float
    speed () const noexcept
    {
      return speed_;
    }

    // Estimated seconds until total is reached or -1 if unknown.
    //
    int
    eta_seconds (std::uint64_t current, std::uint64_t total) const noexcept;

    void
    reset () noexcept;

  private:
    std::uint64_t last_bytes_ = 0;
    std::uint64_t last_update_time_ = 0;
    float speed_ = 0.0f;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <archeon/progress/progress-tracker.ixx>
#include <archeon/progress/progress-tracker.txx>
