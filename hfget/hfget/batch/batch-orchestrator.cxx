#include <hfget/batch/batch-orchestrator.hxx>

#include <string>
#include <optional>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace hfget
{
  asio::awaitable<batch_summary> batch_orchestrator::
  run (const file_entries& files,
       const fs::path& dir,
       transfer_control_ptr ctl,
       transfer_event_handler h)
  {
    if (ctl == nullptr)
      ctl = make_transfer_control ();

    batch_summary r;
    r.total = files.size ();

    for (size_t i (0); i != files.size (); ++i)
    {
      if (ctl->cancelled ())
      {
        r.cancelled = true;
        break;
      }

      const file_entry& f (files[i]);
      string n ('[' + std::to_string (i + 1) + '/' +
                std::to_string (files.size ()) + "] " +
                f.path);

      optional<fs::path> p;
      optional<file_presence> c;
      string err;

      try
      {
        p = local_path (f, dir);
        c = classify (f, dir);
      }
      catch (const invalid_argument& e)
      {
        err = e.what ();
      }

      if (!c)
      {
        ++r.failed;
        co_await emit (h, transfer_event::status (transfer_state::failed,
                                                  n + " (" + err + ')',
                                                  f.path));
        continue;
      }

      ostringstream os;
      os << n << " (" << *c << ')';

      if (*c == file_presence::complete)
      {
        ++r.skipped;
        os << ", skipped";
        co_await emit (h, transfer_event::status (transfer_state::completed,
                                                  os.str (),
                                                  p->string ()));
        continue;
      }

      co_await emit (h, transfer_event::status (transfer_state::idle,
                                                os.str (),
                                                p->string ()));

      transfer_result tr (
        co_await engine_.transfer (transfer_request (f.url, *p), ctl, h));

      if (tr.success ())
        ++r.completed;
      else if (tr.state == transfer_state::cancelled)
      {
        r.cancelled = true;
        break;
      }
      else
        ++r.failed;
    }

    ostringstream os;
    os << (r.cancelled ? "batch cancelled: " : "batch done: ") << r;

    co_await emit (h, transfer_event::status (
                     r.cancelled ? transfer_state::cancelled :
                     r.success () ? transfer_state::completed :
                     transfer_state::failed,
                     os.str ()));

    co_return r;
  }
}
