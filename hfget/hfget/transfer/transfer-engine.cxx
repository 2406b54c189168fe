#include <hfget/transfer/transfer-engine.hxx>

#include <vector>
#include <chrono>
#include <fstream>
#include <optional>
#include <exception>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace hfget
{
  static http_client_traits<>
  stream_traits (http_client_traits<> t, const transfer_traits& tt)
  {
    t.request_timeout = tt.transfer_timeout;
    return t;
  }

  // Return the size of the file or 0 if it does not exist (or is not
  // something we can ask the size of).
  //
  static uint64_t
  existing_size (const fs::path& p)
  {
    error_code ec;
    uint64_t n (fs::file_size (p, ec));
    return ec ? 0 : n;
  }

  transfer_engine::
  transfer_engine (asio::io_context& ioc,
                   http_traits_type ht,
                   traits_type tt)
    : traits_ (tt),
      client_ (ioc, stream_traits (ht, tt)),
      probe_ (ioc, ht, tt.probe_timeout)
  {
  }

  asio::awaitable<transfer_result> transfer_engine::
  transfer (transfer_request rq,
            transfer_control_ptr ctl,
            transfer_event_handler h)
  {
    if (ctl == nullptr)
      ctl = make_transfer_control ();

    if (rq.url.empty ())
      throw invalid_argument ("empty transfer URL");

    if (rq.target.empty ())
      throw invalid_argument ("empty transfer target");

    co_return co_await run (rq, *ctl, h);
  }

  asio::awaitable<transfer_result> transfer_engine::
  run (const transfer_request& rq,
       transfer_control& ctl,
       const transfer_event_handler& h)
  {
    const string t (rq.target.string ());

    // Make sure there is somewhere to write to. This is a local problem that
    // retrying won't fix.
    //
    {
      error_code ec;
      fs::path d (rq.target.parent_path ());

      if (!d.empty ())
        fs::create_directories (d, ec);

      string m;
      if (ec)
        m = "path error: unable to create " + d.string () + ": " + ec.message ();
      else if (fs::is_directory (rq.target, ec))
        m = "path error: " + t + " is a directory";

      if (!m.empty ())
      {
        co_await emit (h, transfer_event::status (transfer_state::failed, m, t));
        co_return transfer_result (transfer_state::failed, 0, 0, move (m));
      }
    }

    uint64_t offset (existing_size (rq.target));

    co_await emit (h, transfer_event::status (transfer_state::probing,
                                              "probing " + rq.url,
                                              t));

    uint64_t total (co_await probe_.probe_size (rq.url));

    if (offset > 0 && total > 0 && offset == total)
    {
      co_await emit (h, transfer_event::progress (total, total, t));
      co_await emit (h, transfer_event::status (transfer_state::completed,
                                                "file exists",
                                                t));
      co_return transfer_result (transfer_state::completed,
                                 total,
                                 total,
                                 "file exists");
    }

    if (offset > 0)
      co_await emit (h, transfer_event::status (
                       transfer_state::transferring,
                       "resuming from " + format_size (offset),
                       t));

    vector<char> buf (traits_.chunk_size);

    for (uint32_t attempt (1);; ++attempt)
    {
      // Outcome of this attempt that needs reporting. We cannot co_await in
      // a catch handler so the exceptions are translated into these first.
      //
      optional<string> fatal;
      optional<string> transient;

      bool cancelled (false);

      try
      {
        http_request req (http_method::get, rq.url);

        if (offset > 0)
          req.set_range (offset);

        unique_ptr<http_stream> s (co_await client_.open (req));

        // The server may simply ignore the range (or reject it if what we
        // have is somehow larger than the resource). Either way the only safe
        // option is to start from scratch.
        //
        if (offset > 0 && s->response ().status != http_status::partial_content)
        {
          co_await emit (h, transfer_event::status (
                           transfer_state::transferring,
                           "range not honored (HTTP " +
                           std::to_string (s->response ().status_code ()) +
                           "), restarting from the beginning",
                           t));

          s.reset ();
          offset = 0;
          req.clear_range ();

          s = co_await client_.open (req);
        }

        const http_response& r (s->response ());

        if (r.status != http_status::ok &&
            r.status != http_status::partial_content)
        {
          string m ("HTTP " + std::to_string (r.status_code ()) + ' ' +
                    (r.reason.empty () ? to_string (r.status) : r.reason));

          co_await emit (h, transfer_event::status (transfer_state::failed, m, t));
          co_return transfer_result (transfer_state::failed,
                                     offset,
                                     total,
                                     move (m));
        }

        if (total == 0)
        {
          if (auto n = r.content_length ())
            total = offset + *n;
        }

        ofstream ofs (rq.target,
                      ios::binary | (offset > 0 ? ios::app : ios::trunc));

        if (!ofs)
          throw runtime_error ("unable to open " + t + " for writing");

        for (;;)
        {
          if (ctl.paused () && !ctl.cancelled ())
          {
            co_await emit (h, transfer_event::status (transfer_state::paused,
                                                      "paused",
                                                      t));

            chrono::milliseconds i (traits_.pause_interval);
            if (co_await ctl.wait_while_paused (i))
              co_await emit (h, transfer_event::status (
                               transfer_state::transferring, "resumed", t));
          }

          if (ctl.cancelled ())
          {
            cancelled = true;
            break;
          }

          size_t n (co_await s->read_some (buf.data (), buf.size ()));

          if (n == 0)
            break;

          ofs.write (buf.data (), static_cast<streamsize> (n));

          if (!ofs)
            throw runtime_error ("unable to write to " + t);

          offset += n;

          if (total > 0)
            co_await emit (h, transfer_event::progress (offset, total, t));
        }

        ofs.close ();

        if (!ofs)
          throw runtime_error ("unable to write to " + t);

        if (!cancelled)
        {
          co_await emit (h, transfer_event::status (transfer_state::completed,
                                                    "done",
                                                    t));

          co_return transfer_result (transfer_state::completed,
                                     offset,
                                     total != 0 ? total : offset,
                                     "done");
        }
      }
      catch (const boost::system::system_error& e)
      {
        if (is_transient (e.code ()))
          transient = e.what ();
        else
          fatal = e.what ();
      }
      catch (const exception& e)
      {
        fatal = e.what ();
      }

      if (cancelled)
      {
        co_await emit (h, transfer_event::status (transfer_state::cancelled,
                                                  "cancelled",
                                                  t));
        co_return transfer_result (transfer_state::cancelled,
                                   existing_size (rq.target),
                                   total,
                                   "cancelled");
      }

      if (fatal)
      {
        string m ("error: " + *fatal);

        co_await emit (h, transfer_event::status (transfer_state::failed, m, t));
        co_return transfer_result (transfer_state::failed,
                                   existing_size (rq.target),
                                   total,
                                   move (m));
      }

      // Transient failure.
      //
      if (attempt >= traits_.max_attempts)
      {
        string m ("failed after " + std::to_string (attempt) + " attempts: " +
                  *transient);

        co_await emit (h, transfer_event::status (transfer_state::failed, m, t));
        co_return transfer_result (transfer_state::failed,
                                   existing_size (rq.target),
                                   total,
                                   move (m));
      }

      co_await emit (h, transfer_event::status (
                       transfer_state::transferring,
                       "retrying (attempt " + std::to_string (attempt + 1) +
                       " of " + std::to_string (traits_.max_attempts) + "): " +
                       *transient,
                       t));

      // The backoff is cut short by a cancel.
      //
      if (!co_await ctl.wait_for (chrono::milliseconds (traits_.retry_delay)))
      {
        co_await emit (h, transfer_event::status (transfer_state::cancelled,
                                                  "cancelled",
                                                  t));
        co_return transfer_result (transfer_state::cancelled,
                                   existing_size (rq.target),
                                   total,
                                   "cancelled");
      }

      // Whatever reached the disk before the failure is kept.
      //
      offset = existing_size (rq.target);
    }
  }
}
