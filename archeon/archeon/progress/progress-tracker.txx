#include <cmath>
#include <iterator>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace archeon
{
  namespace progress_detail
  {
    // Scale v down to the largest IEC unit it reaches. Plain bytes get p
    // decimals, everything else one.
    //
    inline std::string
    iec (double v, const char* suffix, int p)
    {
      static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

      std::size_t i (0);
      for (; v >= 1024.0 && i + 1 != std::size (units); ++i)
        v /= 1024.0;

      std::ostringstream o;
      o << std::fixed << std::setprecision (i == 0 ? p : 1) << v
        << ' ' << units[i] << suffix;

      return o.str ();
    }
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    return string_type (
      progress_detail::iec (static_cast<double> (n), "", 0));
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bps)
  {
    return string_type (progress_detail::iec (bps, "/s", 0));
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    std::ostringstream o;
    o << std::setfill ('0');

    if (s >= 3600)
      o << s / 3600 << 'h';

    o << std::setw (2) << s % 3600 / 60 << 'm'
      << std::setw (2) << s % 60 << 's';

    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    string_type b (static_cast<std::size_t> (w), ' ');

    if (ind)
      b.replace (0, 6, " <==> ");
    else
    {
      // A complete bar has no arrow head.
      //
      std::size_t f (
        static_cast<std::size_t> (std::clamp (p, 0.0f, 1.0f) * w));

      b.replace (0, f, f, '=');

      if (f != 0 && f != b.size ())
        b[f - 1] = '>';
    }

    return '[' + b + ']';
  }

  template <typename T>
  bool basic_progress_tracker<T>::
  update (std::uint64_t n, std::uint64_t t) noexcept
  {
    std::uint64_t t0 (last_update_time_);

    // Recalculating speed on every chunk is both wasteful and noisy, so
    // enforce a minimum interval between samples.
    //
    if (t0 != 0 && (t < t0 || t - t0 < traits_type::min_update_interval_ms * 1000))
      return false;

    std::uint64_t n0 (last_bytes_);

    float inst (0.0f);
    if (t0 != 0)
    {
      std::uint64_t dt (t - t0);
      std::uint64_t dn (n > n0 ? n - n0 : 0);

      inst = static_cast<float> (dn) /
             (static_cast<float> (dt) / 1000000.0f);
    }

    // The first real sample seeds the average.
    //
    if (speed_ == 0.0f)
      speed_ = inst;
    else
      speed_ = traits_type::ewma_alpha * inst +
               (1.0f - traits_type::ewma_alpha) * speed_;

    last_bytes_ = n;
    last_update_time_ = t;

    return true;
  }

  template <typename T>
  int basic_progress_tracker<T>::
  eta_seconds (std::uint64_t c, std::uint64_t t) const noexcept
  {
    if (speed_ <= 0.0f || t == 0)
      return -1;

    if (c >= t)
      return 0;

    return static_cast<int> (std::ceil (static_cast<float> (t - c) / speed_));
  }
}
