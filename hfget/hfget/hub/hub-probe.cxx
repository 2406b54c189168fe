#include <hfget/hub/hub-probe.hxx>

#include <exception>
#include <iostream>

using namespace std;

namespace hfget
{
  static http_client_traits<>
  probe_traits (http_client_traits<> t, uint32_t timeout)
  {
    if (t.connect_timeout == 0 || t.connect_timeout > timeout)
      t.connect_timeout = timeout;

    if (t.request_timeout == 0 || t.request_timeout > timeout)
      t.request_timeout = timeout;

    return t;
  }

  hub_probe::
  hub_probe (asio::io_context& ioc, traits_type t, uint32_t timeout)
    : client_ (ioc, probe_traits (move (t), timeout))
  {
  }

  asio::awaitable<uint64_t> hub_probe::
  probe_size (const string& url)
  {
    last_error_.clear ();

    const auto& tr (client_.session ().traits ());

    try
    {
      http_response r (co_await client_.head (url));

      if (!r.is_success ())
      {
        last_error_ = "HTTP " + std::to_string (r.status_code ());
      }
      else if (auto n = r.content_length ())
      {
        co_return *n;
      }
      else
        last_error_ = "no Content-Length in response";
    }
    catch (const exception& e)
    {
      last_error_ = e.what ();
    }

    if (tr.verbosity >= 1)
      cerr << "info: size of " << url << " unknown: " << last_error_ << endl;

    co_return 0;
  }
}
