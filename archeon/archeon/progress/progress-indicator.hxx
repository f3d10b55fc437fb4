#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <iostream>

#include <ftxui/dom/elements.hpp>

#include <archeon/progress/progress-tracker.hxx>

namespace archeon
{
  // Single-line terminal progress bar.
  //
  // The line is laid out with FTXUI and redrawn in place on the output
  // stream, at most once per tracker sample interval. finish() draws the
  // final state unconditionally and moves to the next line.
  //
  class progress_indicator
  {
  public:
    using tracker_type = progress_tracker;
    using traits_type  = tracker_type::traits_type;

    static constexpr int bar_width = 30;

    explicit
    progress_indicator (std::uint64_t total, std::ostream& = std::cout);

    progress_indicator (const progress_indicator&) = delete;
    progress_indicator& operator= (const progress_indicator&) = delete;

    // Terminate a line left half-drawn by an unfinished indicator.
    //
    ~progress_indicator ();

    void
    set_position (std::uint64_t);

    void
    finish ();

    std::uint64_t
    position () const noexcept {return position_;}

    std::uint64_t
    total () const noexcept {return total_;}

    bool
    finished () const noexcept {return finished_;}

    // Completed fraction in [0, 1]. 0 if the total is unknown (zero).
    //
    float
    ratio () const noexcept;

    // Left and right hand sides of the line, as plain text.
    //
    std::string
    summary () const;

    std::string
    rate () const;

    ftxui::Element
    render () const;

  private:
    void
    draw ();

  private:
    std::ostream& os_;
    std::uint64_t total_;
    std::uint64_t position_ = 0;
    bool finished_ = false;
    bool drawn_ = false;

    tracker_type tracker_;
    std::string reset_;
  };
}
