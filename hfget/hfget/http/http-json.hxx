#pragma once

#include <string>

#include <boost/json.hpp>
#include <boost/asio.hpp>

#include <hfget/http/http-types.hxx>
#include <hfget/http/http-response.hxx>
#include <hfget/http/http-client.hxx>

namespace hfget
{
  // Parse the response body as JSON. Throw std::runtime_error if there is no
  // body or it is not valid JSON.
  //
  template <typename S>
  boost::json::value
  parse_json (const basic_http_response<S>&);

  // JSON-over-HTTP client for the read-only API endpoints we talk to.
  //
  template <typename T = http_client_traits<>>
  class basic_json_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using client_type   = basic_http_client<traits_type>;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;

    explicit
    basic_json_http_client (boost::asio::io_context& ioc)
      : client_ (ioc) {}

    basic_json_http_client (boost::asio::io_context& ioc,
                            const traits_type& traits)
      : client_ (ioc, traits) {}

    basic_json_http_client (const basic_json_http_client&) = delete;
    basic_json_http_client& operator= (const basic_json_http_client&) = delete;

    // GET the document. Any non-2xx final status is an error.
    //
    boost::asio::awaitable<boost::json::value>
    get_json (const string_type& url);

    client_type&
    client () noexcept
    {
      return client_;
    }

  private:
    client_type client_;
  };

  using json_http_client = basic_json_http_client<>;
}

#include <hfget/http/http-json.ixx>
