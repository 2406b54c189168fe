#pragma once

#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <hfget/http/http-client.hxx>

namespace hfget
{
  // Remote size probe.
  //
  // Issue a HEAD request (following redirects) and return the declared
  // Content-Length of the final response. Many mirrors omit the header for
  // some files so an unknown size is a normal outcome: any failure (network
  // error, non-2xx status, missing or invalid header) yields 0. The reason is
  // kept for diagnostics.
  //
  class hub_probe
  {
  public:
    using traits_type = http_client_traits<>;

    static constexpr std::uint32_t default_timeout = 10000; // ms

    // The connect and request timeouts are both capped to the timeout.
    //
    hub_probe (boost::asio::io_context&,
               traits_type = traits_type (),
               std::uint32_t timeout = default_timeout);

    boost::asio::awaitable<std::uint64_t>
    probe_size (const std::string& url);

    const std::string&
    last_error () const noexcept
    {
      return last_error_;
    }

  private:
    http_client client_;
    std::string last_error_;
  };
}
