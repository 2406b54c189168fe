#pragma once

#include <boost/asio.hpp>

#include <hfget/http/http-client.hxx>
#include <hfget/hub/hub-probe.hxx>
#include <hfget/transfer/transfer-types.hxx>
#include <hfget/transfer/transfer-control.hxx>
#include <hfget/transfer/transfer-events.hxx>

namespace hfget
{
  // Resumable single file transfer.
  //
  // An existing file at the target is taken to be a prefix of the resource:
  // if it already has the remote size nothing is fetched, otherwise the rest
  // is requested with a Range header and appended. Servers that ignore the
  // range get a fresh full download instead.
  //
  // Network failures that look transient (see is_transient()) are retried
  // up to traits.max_attempts times, each attempt resuming from whatever
  // made it to disk. HTTP error statuses and local file errors end the
  // transfer right away.
  //
  // Cancellation and pause are checked before every chunk. A cancelled
  // transfer leaves the partial file in place for a later resume.
  //
  class transfer_engine
  {
  public:
    using traits_type      = transfer_traits;
    using http_traits_type = http_client_traits<>;

    explicit
    transfer_engine (asio::io_context&,
                     http_traits_type = http_traits_type (),
                     traits_type = traits_type ());

    transfer_engine (const transfer_engine&) = delete;
    transfer_engine& operator= (const transfer_engine&) = delete;

    // Fetch the request's URL into its target. If no control is passed a
    // fresh one is used.
    //
    asio::awaitable<transfer_result>
    transfer (transfer_request,
              transfer_control_ptr = nullptr,
              transfer_event_handler = nullptr);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    asio::awaitable<transfer_result>
    run (const transfer_request&,
         transfer_control&,
         const transfer_event_handler&);

  private:
    traits_type traits_;
    http_client client_;
    hub_probe probe_;
  };
}
