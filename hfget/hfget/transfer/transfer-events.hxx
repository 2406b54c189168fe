#pragma once

#include <string>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <hfget/transfer/transfer-types.hxx>

namespace hfget
{
  namespace asio = boost::asio;

  // Sink for the events of a transfer.
  //
  // The engine awaits the handler for every event, in program order, on its
  // own executor. A handler that forwards into a bounded channel therefore
  // suspends the transfer while the consumer is behind.
  //
  using transfer_event_handler =
    std::function<asio::awaitable<void> (transfer_event)>;

  // Thread-safe bounded queue carrying events from the worker to the
  // controlling context.
  //
  using transfer_event_channel =
    asio::experimental::concurrent_channel<
      void (boost::system::error_code, transfer_event)>;

  // Default channel capacity.
  //
  constexpr std::size_t transfer_event_capacity = 64;

  using progress_callback =
    std::function<void (double percent,
                        std::uint64_t downloaded,
                        std::uint64_t total)>;

  using status_callback = std::function<void (const std::string&)>;

  // Adapt plain callbacks. Either may be empty. The callbacks run on the
  // worker and must do their own marshaling if they need another thread.
  //
  transfer_event_handler
  make_callback_handler (progress_callback = nullptr,
                         status_callback = nullptr);

  // Forward every event into the channel. The channel must outlive the
  // transfer.
  //
  transfer_event_handler
  make_channel_handler (transfer_event_channel&);

  // Deliver the event if there is a handler.
  //
  inline asio::awaitable<void>
  emit (const transfer_event_handler& h, transfer_event e)
  {
    if (h)
      co_await h (std::move (e));
  }
}
