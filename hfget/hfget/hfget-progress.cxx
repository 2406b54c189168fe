#include <hfget/hfget-progress.hxx>

#include <filesystem>

using namespace std;

namespace hfget
{
  void progress_coordinator::
  finish_line ()
  {
    renderer_.finish ();
  }

  void progress_coordinator::
  render (const transfer_event& e)
  {
    switch (e.kind)
    {
    case transfer_event::kind_type::progress:
      {
        if (quiet_)
          break;

        renderer_.draw (filesystem::path (e.target).filename ().string (),
                        e.downloaded,
                        e.total);
        break;
      }
    case transfer_event::kind_type::status:
    case transfer_event::kind_type::finished:
      {
        if (e.state == transfer_state::probing && verbosity_ < 1)
          break;

        finish_line ();

        if (e.state == transfer_state::failed)
        {
          if (e.message.compare (0, 7, "error: ") == 0)
            err_ << e.message << endl;
          else
            err_ << "error: " << e.message << endl;
        }
        else if (e.state == transfer_state::probing)
          err_ << "info: " << e.message << endl;
        else
          out_ << e.message << endl;

        break;
      }
    }
  }
}
