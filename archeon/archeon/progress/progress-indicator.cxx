#include <archeon/progress/progress-indicator.hxx>

#include <sstream>
#include <iomanip>

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

using namespace std;

namespace archeon
{
  progress_indicator::
  progress_indicator (uint64_t t, ostream& o)
    : os_ (o), total_ (t)
  {
  }

  progress_indicator::
  ~progress_indicator ()
  {
    if (drawn_ && !finished_)
      os_ << endl;
  }

  float progress_indicator::
  ratio () const noexcept
  {
    if (total_ == 0)
      return 0.0f;

    if (position_ >= total_)
      return 1.0f;

    return static_cast<float> (static_cast<double> (position_) /
                               static_cast<double> (total_));
  }

  void progress_indicator::
  set_position (uint64_t n)
  {
    if (finished_)
      return;

    position_ = n;

    if (tracker_.update (n))
      draw ();
  }

  void progress_indicator::
  finish ()
  {
    if (finished_)
      return;

    tracker_.update (position_);
    draw ();

    os_ << endl;
    finished_ = true;
  }

  string progress_indicator::
  summary () const
  {
    ostringstream o;

    o << traits_type::format_bar (ratio (), total_ == 0, bar_width)
      << ' ' << setw (3) << static_cast<int> (ratio () * 100) << "%  "
      << traits_type::format_bytes (position_) << " / "
      << traits_type::format_bytes (total_);

    return o.str ();
  }

  string progress_indicator::
  rate () const
  {
    ostringstream o;
    o << traits_type::format_speed (tracker_.speed ());

    int eta (tracker_.eta_seconds (position_, total_));
    if (eta > 0)
      o << "  ETA: " << traits_type::format_duration (eta);

    return o.str ();
  }

  ftxui::Element progress_indicator::
  render () const
  {
    using namespace ftxui;

    return hbox ({
      text (summary ()),
      filler (),
      text (rate ())
    });
  }

  void progress_indicator::
  draw ()
  {
    ftxui::Element d (render ());

    // Size to the terminal width (FTXUI falls back to 80 columns when we are
    // not attached to one) and to the one row the document needs.
    //
    auto s (ftxui::Screen::Create (ftxui::Dimension::Full (),
                                   ftxui::Dimension::Fit (d)));
    ftxui::Render (s, d);

    os_ << reset_ << s.ToString () << flush;

    reset_ = s.ResetPosition ();
    drawn_ = true;
  }
}
