#pragma once

#include <string>
#include <cstdint>
#include <ostream>

#include <hfget/transfer/transfer-types.hxx>
#include <hfget/progress/progress-renderer.hxx>

namespace hfget
{
  // Console rendering of transfer events.
  //
  // Status messages go on their own lines, failures to the error stream with
  // the error: prefix. Progress is a single line redrawn in place which is
  // terminated before anything else is printed.
  //
  class progress_coordinator
  {
  public:
    progress_coordinator (std::ostream& out,
                          std::ostream& err,
                          std::uint16_t verbosity,
                          bool quiet,
                          int width = 0)
      : out_ (out),
        err_ (err),
        verbosity_ (verbosity),
        quiet_ (quiet),
        renderer_ (out, width) {}

    progress_coordinator (const progress_coordinator&) = delete;
    progress_coordinator& operator= (const progress_coordinator&) = delete;

    ~progress_coordinator ()
    {
      finish_line ();
    }

    void
    render (const transfer_event&);

    // Terminate the progress line if one is being displayed.
    //
    void
    finish_line ();

    // Return the progress statistics, for example
    // "1.50 MB / 3.00 MB (50.0%)".
    //
    static std::string
    format_progress (std::uint64_t downloaded, std::uint64_t total)
    {
      return progress_renderer_traits<>::format_stats (downloaded, total);
    }

  private:
    std::ostream& out_;
    std::ostream& err_;
    std::uint16_t verbosity_;
    bool quiet_;

    progress_renderer renderer_;
  };
}
