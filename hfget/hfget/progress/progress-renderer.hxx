#pragma once

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <string>
#include <cstdint>
#include <ostream>

namespace hfget
{
  // Renderer traits for customization.
  //
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    // Default bar width for rendering.
    //
    static constexpr int default_bar_width = 20;

    // Render the progress of a single file.
    //
    // With an unknown total only the downloaded amount is shown.
    //
    static ftxui::Element
    render_item (const string_type& label,
                 std::uint64_t downloaded,
                 std::uint64_t total,
                 int bar_width = default_bar_width);

    // Return the statistics text, for example "1.50 MB / 3.00 MB (50.0%)".
    //
    static string_type
    format_stats (std::uint64_t downloaded, std::uint64_t total);

    static string_type
    format_bar (double ratio, int width);
  };

  // Single line progress display redrawn in place.
  //
  // Unlike a full screen interactive renderer this one leaves the terminal
  // alone between draws so that ordinary output (status lines, prompts) can
  // be interleaved once the line is finished.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    // A zero width means the terminal width.
    //
    explicit
    basic_progress_renderer (std::ostream& os, int width = 0)
      : os_ (os), width_ (width) {}

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    // Draw over the previous line.
    //
    void
    draw (const string_type& label,
          std::uint64_t downloaded,
          std::uint64_t total);

    // Terminate the line if one is displayed.
    //
    void
    finish ();

    bool
    active () const noexcept
    {
      return active_;
    }

  private:
    std::ostream& os_;
    int width_;

    std::string reset_; // Cursor movement back to the start of the line.
    bool active_ = false;
  };

  using progress_renderer = basic_progress_renderer<>;
}

#include <hfget/progress/progress-renderer.txx>
