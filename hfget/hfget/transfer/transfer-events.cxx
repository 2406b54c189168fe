#include <hfget/transfer/transfer-events.hxx>

using namespace std;

namespace hfget
{
  transfer_event_handler
  make_callback_handler (progress_callback p, status_callback s)
  {
    return [p = move (p), s = move (s)] (transfer_event e) -> asio::awaitable<void>
    {
      switch (e.kind)
      {
      case transfer_event::kind_type::progress:
        {
          if (p)
            p (e.percent, e.downloaded, e.total);
          break;
        }
      case transfer_event::kind_type::status:
      case transfer_event::kind_type::finished:
        {
          if (s)
            s (e.message);
          break;
        }
      }

      co_return;
    };
  }

  transfer_event_handler
  make_channel_handler (transfer_event_channel& ch)
  {
    return [&ch] (transfer_event e) -> asio::awaitable<void>
    {
      co_await ch.async_send (boost::system::error_code (),
                              move (e),
                              asio::use_awaitable);
    };
  }
}
