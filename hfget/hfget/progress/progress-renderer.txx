#include <ftxui/screen/terminal.hpp>

#include <sstream>
#include <iomanip>

#include <hfget/transfer/transfer-types.hxx>

namespace hfget
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_item (const string_type& label,
               std::uint64_t d,
               std::uint64_t t,
               int w)
  {
    using namespace ftxui;

    if (t == 0)
    {
      return hbox ({
        text (label),
        filler (),
        text (" " + format_stats (d, t))
      });
    }

    // Fixed widths keep the bar from jittering as the numbers change.
    //
    std::ostringstream r;
    r << ' ' << format_bar (percent_of (d, t) / 100.0, w)
      << ' ' << std::right << std::setw (28) << format_stats (d, t);

    return hbox ({
      text (label),
      filler (),
      text (r.str ())
    });
  }

  template <typename S>
  typename progress_renderer_traits<S>::string_type
  progress_renderer_traits<S>::
  format_stats (std::uint64_t d, std::uint64_t t)
  {
    std::ostringstream o;
    o << format_size (d);

    if (t > 0)
      o << " / " << format_size (t) << " ("
        << std::fixed << std::setprecision (1) << percent_of (d, t) << "%)";

    return o.str ();
  }

  template <typename S>
  typename progress_renderer_traits<S>::string_type
  progress_renderer_traits<S>::
  format_bar (double p, int w)
  {
    std::ostringstream o;
    o << "[";

    int filled (static_cast<int> (p * w));

    for (int i (0); i < w; ++i)
    {
      if (i < filled - 1)
        o << "=";
      else if (i == filled - 1)
        o << ">";
      else
        o << " ";
    }

    o << "]";
    return o.str ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  draw (const string_type& label, std::uint64_t d, std::uint64_t t)
  {
    using namespace ftxui;

    Element e (traits_type::render_item (label, d, t));

    int w (width_ != 0 ? width_ : Terminal::Size ().dimx);

    // The screen is as wide as the line so the whole previous draw is
    // overwritten.
    //
    Screen s (Screen::Create (Dimension::Fixed (w), Dimension::Fit (e)));
    Render (s, e);

    os_ << reset_ << s.ToString () << std::flush;

    reset_ = s.ResetPosition ();
    active_ = true;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    if (active_)
    {
      os_ << std::endl;
      reset_.clear ();
      active_ = false;
    }
  }
}
