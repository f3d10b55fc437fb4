namespace archeon
{
  // Current time in microseconds since the steady clock epoch.
  //
  inline std::uint64_t
  current_time_us () noexcept
  {
    using namespace std::chrono;
    auto now (steady_clock::now ());
    auto us (duration_cast<microseconds> (now.time_since_epoch ()));
    return static_cast<std::uint64_t> (us.count ());
  }

  template <typename T>
  inline bool basic_progress_tracker<T>::
  update (std::uint64_t n) noexcept
  {
    return update (n, current_time_us ());
  }

  template <typename T>
  inline void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_bytes_ = 0;
    last_update_time_ = 0;
    speed_ = 0.0f;
  }
}
