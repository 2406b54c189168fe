#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <hfget/version.hxx>
#include <hfget/http/http-types.hxx>
#include <hfget/http/http-request.hxx>
#include <hfget/http/http-response.hxx>
#include <hfget/http/http-stream.hxx>

namespace hfget
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options/configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;
    using stream_type   = basic_http_stream<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds (0 = no timeout). For streamed
    // responses it bounds each individual read, not the whole transfer.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    bool verify_ssl = true;

    // CA bundle path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("hfget/" HFGET_VERSION_ID);

    // Upper bound for bodies read into memory by request().
    //
    std::uint64_t max_body_size = 64 * 1024 * 1024;

    // Diagnostics level. At 2 and above every exchange and redirect is traced
    // to stderr.
    //
    std::uint16_t verbosity = 0;
  };

  // HTTP client session context.
  //
  // Holds the TLS context shared by all the connections made by the client.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Buffered requests (request(), get(), head()) read the whole response
  // into memory and are meant for small documents such as API replies.
  // Large resources are fetched with open() which returns a stream
  // positioned at the start of the body.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using stream_type   = typename traits_type::stream_type;
    using session_type  = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform an HTTP request and return the response with its body (no
    // body for HEAD).
    //
    asio::awaitable<response_type>
    request (request_type req);

    asio::awaitable<response_type>
    get (const string_type& url);

    asio::awaitable<response_type>
    head (const string_type& url);

    // Perform the request following redirects and return the stream of the
    // final response. The request headers (Range in particular) are carried
    // over to every hop.
    //
    asio::awaitable<std::unique_ptr<stream_type>>
    open (request_type req);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<std::unique_ptr<stream_type>>
    open_impl (request_type req, std::uint8_t redirect_count);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <hfget/http/http-client.ixx>
#include <hfget/http/http-client.txx>
