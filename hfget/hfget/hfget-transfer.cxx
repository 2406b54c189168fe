#include <hfget/hfget-transfer.hxx>

#include <mutex>
#include <thread>
#include <exception>

#include <hfget/batch/batch-orchestrator.hxx>

using namespace std;

namespace hfget
{
  transfer_coordinator::
  transfer_coordinator (asio::io_context& ioc,
                        http_traits_type ht,
                        traits_type tt)
    : ioc_ (ioc),
      http_traits_ (move (ht)),
      traits_ (tt),
      control_ (make_transfer_control ())
  {
  }

  void transfer_coordinator::
  pause ()
  {
    control ()->pause ();
  }

  void transfer_coordinator::
  resume ()
  {
    control ()->resume ();
  }

  void transfer_coordinator::
  cancel ()
  {
    control ()->cancel ();
  }

  transfer_control_ptr transfer_coordinator::
  control ()
  {
    lock_guard<mutex> l (mutex_);
    return control_;
  }

  asio::awaitable<transfer_state> transfer_coordinator::
  download_file (transfer_request rq)
  {
    co_return co_await execute (
      [rq = move (rq)] (transfer_engine& e,
                        transfer_control_ptr c,
                        transfer_event_handler h) -> asio::awaitable<transfer_state>
      {
        transfer_result r (co_await e.transfer (rq, move (c), move (h)));
        co_return r.state;
      });
  }

  asio::awaitable<transfer_state> transfer_coordinator::
  download_batch (file_entries files, fs::path dir)
  {
    co_return co_await execute (
      [files = move (files), dir = move (dir)] (
        transfer_engine& e,
        transfer_control_ptr c,
        transfer_event_handler h) -> asio::awaitable<transfer_state>
      {
        batch_orchestrator o (e);
        batch_summary s (co_await o.run (files, dir, move (c), move (h)));

        co_return s.cancelled ? transfer_state::cancelled :
                  s.success () ? transfer_state::completed :
                  transfer_state::failed;
      });
  }

  asio::awaitable<transfer_state> transfer_coordinator::
  execute (job_type job)
  {
    transfer_control_ptr ctl (make_transfer_control ());
    {
      lock_guard<mutex> l (mutex_);
      control_ = ctl;
    }

    // The channel lives on the controlling side. The worker blocks in send
    // whenever we fall behind.
    //
    transfer_event_channel ch (ioc_, transfer_event_capacity);

    asio::io_context wioc;
    transfer_engine engine (wioc, http_traits_, traits_);

    asio::co_spawn (
      wioc,
      [&job, &engine, &ch, ctl] () -> asio::awaitable<void>
      {
        transfer_state s (transfer_state::failed);
        string m;

        try
        {
          s = co_await job (engine, ctl, make_channel_handler (ch));
        }
        catch (const exception& e)
        {
          m = e.what ();
        }

        // If the channel is gone there is nobody left to tell.
        //
        boost::system::error_code ec;
        co_await ch.async_send (boost::system::error_code (),
                                transfer_event::finished (s, move (m)),
                                asio::redirect_error (asio::use_awaitable, ec));
      },
      asio::detached);

    jthread worker ([&wioc] () {wioc.run ();});

    transfer_state r (transfer_state::failed);

    try
    {
      for (;;)
      {
        transfer_event e (co_await ch.async_receive (asio::use_awaitable));

        if (e.kind == transfer_event::kind_type::finished)
        {
          r = e.state;

          if (!e.message.empty () && event_callback_)
            event_callback_ (
              transfer_event::status (transfer_state::failed,
                                      "error: " + e.message));
          break;
        }

        if (event_callback_)
          event_callback_ (e);
      }
    }
    catch (const exception&)
    {
      // Make sure the worker can finish before we leave: stop the job and
      // fail any send it is blocked in.
      //
      ctl->cancel ();
      ch.close ();
      throw;
    }

    co_return r;
  }
}
