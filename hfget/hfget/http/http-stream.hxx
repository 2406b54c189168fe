#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <hfget/http/http-types.hxx>
#include <hfget/http/http-request.hxx>
#include <hfget/http/http-response.hxx>

namespace hfget
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // A single HTTP exchange whose response body is consumed incrementally.
  //
  // Once open() returns, the response status and headers are available and
  // the body is still on the wire. The caller pulls it with read_some() which
  // fills a caller-provided buffer, so memory use is bounded by that buffer
  // regardless of the resource size.
  //
  // Network failures are reported by throwing boost::system::system_error
  // (see is_transient() for classifying them).
  //
  template <typename S = std::string>
  class basic_http_stream
  {
  public:
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Timeouts are in milliseconds, 0 meaning no timeout.
    //
    basic_http_stream (asio::io_context& ioc,
                       ssl::context& ssl,
                       std::uint32_t connect_timeout,
                       std::uint32_t request_timeout)
      : ioc_ (ioc),
        ssl_ (ssl),
        connect_timeout_ (connect_timeout),
        request_timeout_ (request_timeout) {}

    basic_http_stream (const basic_http_stream&) = delete;
    basic_http_stream& operator= (const basic_http_stream&) = delete;

    ~basic_http_stream ()
    {
      close ();
    }

    // Connect, send the request, and read the response header. For HEAD
    // requests the body is never expected.
    //
    asio::awaitable<void>
    open (const request_type&);

    const response_type&
    response () const noexcept
    {
      return response_;
    }

    // Read the next piece of the body into the buffer returning the number
    // of bytes stored. Return 0 once the body is complete.
    //
    asio::awaitable<std::size_t>
    read_some (char* data, std::size_t size);

    // Read the rest of the body into a string. Throw std::runtime_error if it
    // exceeds the limit.
    //
    asio::awaitable<string_type>
    read_all (std::uint64_t limit);

    // Drop the connection without waiting for the peer. Any unread body is
    // discarded.
    //
    void
    close () noexcept;

  private:
    using tcp_stream_type = beast::tcp_stream;
    using tls_stream_type = beast::ssl_stream<beast::tcp_stream>;
    using parser_type =
      beast::http::response_parser<beast::http::buffer_body>;

    template <typename T>
    asio::awaitable<void>
    exchange (T&, const request_type&);

    template <typename T>
    asio::awaitable<std::size_t>
    read_body (T&, char*, std::size_t);

    void
    expire (beast::tcp_stream&, std::uint32_t ms);

  private:
    asio::io_context& ioc_;
    ssl::context& ssl_;
    std::uint32_t connect_timeout_;
    std::uint32_t request_timeout_;

    // Exactly one of these is set once open() has connected.
    //
    std::unique_ptr<tcp_stream_type> tcp_;
    std::unique_ptr<tls_stream_type> tls_;

    beast::flat_buffer buffer_;
    std::optional<parser_type> parser_;
    response_type response_;
  };

  using http_stream = basic_http_stream<std::string>;
}

#include <hfget/http/http-stream.txx>
