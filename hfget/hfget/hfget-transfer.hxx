#pragma once

#include <mutex>
#include <memory>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <hfget/hub/hub-types.hxx>
#include <hfget/http/http-client.hxx>
#include <hfget/transfer/transfer-types.hxx>
#include <hfget/transfer/transfer-control.hxx>
#include <hfget/transfer/transfer-events.hxx>
#include <hfget/transfer/transfer-engine.hxx>

namespace hfget
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Run transfers on a worker thread on behalf of the controlling context.
  //
  // Each download call starts a dedicated io_context on its own thread, runs
  // the job there, and relays its events back through a bounded channel. The
  // controlling coroutine receives them in order and hands them to the event
  // callback until the job reports completion. Only one job runs at a time.
  //
  class transfer_coordinator
  {
  public:
    using http_traits_type = http_client_traits<>;
    using traits_type      = transfer_traits;

    using event_callback = std::function<void (const transfer_event&)>;

    transfer_coordinator (asio::io_context& ioc,
                          http_traits_type,
                          traits_type);

    transfer_coordinator (const transfer_coordinator&) = delete;
    transfer_coordinator& operator= (const transfer_coordinator&) = delete;

    void
    set_event_callback (event_callback cb)
    {
      event_callback_ = std::move (cb);
    }

    // Download a single file. Return the terminal state.
    //
    asio::awaitable<transfer_state>
    download_file (transfer_request);

    // Download the files into the directory one after another. Return
    // completed if every file is complete, cancelled if the batch was
    // interrupted, and failed otherwise.
    //
    asio::awaitable<transfer_state>
    download_batch (file_entries, fs::path dir);

    // Signal the running job (no-op if there is none). Safe to call from
    // any thread.
    //
    void
    pause ();

    void
    resume ();

    void
    cancel ();

  private:
    using job_type =
      std::function<asio::awaitable<transfer_state> (transfer_engine&,
                                                     transfer_control_ptr,
                                                     transfer_event_handler)>;

    asio::awaitable<transfer_state>
    execute (job_type);

    transfer_control_ptr
    control ();

  private:
    asio::io_context& ioc_;
    http_traits_type http_traits_;
    traits_type traits_;
    event_callback event_callback_;

    // Control of the running job. Replaced (never reset) for every job so a
    // signal that arrives late cannot reach the next one. Signals may come
    // from another thread, hence the mutex.
    //
    std::mutex mutex_;
    transfer_control_ptr control_;
  };
}
