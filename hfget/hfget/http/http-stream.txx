#include <chrono>
#include <limits>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <hfget/http/http-url.hxx>

namespace hfget
{
  template <typename S>
  inline void basic_http_stream<S>::
  expire (beast::tcp_stream& s, std::uint32_t ms)
  {
    if (ms != 0)
      s.expires_after (std::chrono::milliseconds (ms));
    else
      s.expires_never ();
  }

  template <typename S>
  asio::awaitable<void> basic_http_stream<S>::
  open (const request_type& req)
  {
    using tcp = asio::ip::tcp;

    url_parts parts (parse_url (req.url));

    if (parts.scheme != "https" && parts.scheme != "http")
      throw std::runtime_error ("unsupported URL scheme: " + parts.scheme);

    tcp::resolver rslv (ioc_);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    if (parts.scheme == "https")
    {
      tls_ = std::make_unique<tls_stream_type> (ioc_, ssl_);

      // Set the SNI hostname, otherwise many servers (CDNs in particular)
      // reject the handshake or present the wrong certificate.
      //
      if (!SSL_set_tlsext_host_name (tls_->native_handle (),
                                     parts.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      auto& layer (beast::get_lowest_layer (*tls_));
      expire (layer, connect_timeout_);

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await tls_->async_handshake (ssl::stream_base::client,
                                      asio::use_awaitable);

      co_await exchange (*tls_, req);
    }
    else
    {
      tcp_ = std::make_unique<tcp_stream_type> (ioc_);
      expire (*tcp_, connect_timeout_);

      co_await tcp_->async_connect (addrs, asio::use_awaitable);
      co_await exchange (*tcp_, req);
    }
  }

  template <typename S>
  template <typename T>
  asio::awaitable<void> basic_http_stream<S>::
  exchange (T& s, const request_type& req)
  {
    namespace http = beast::http;

    auto& layer (beast::get_lowest_layer (s));

    http::request<http::string_body> br;
    br.method_string (to_string (req.method));
    br.target (req.target ());
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    expire (layer, request_timeout_);
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the header only. The body is pulled by the caller through
    // read_some() so that we never buffer a whole resource in memory.
    //
    parser_.emplace ();
    parser_->body_limit (std::numeric_limits<std::uint64_t>::max ());

    // A response to HEAD carries the Content-Length of the resource but no
    // body. Without telling the parser, it would sit there waiting for bytes
    // that never come.
    //
    if (req.method == http_method::head)
      parser_->skip (true);

    co_await http::async_read_header (s, buffer_, *parser_, asio::use_awaitable);

    const auto& m (parser_->get ());

    response_type r;
    r.status  = static_cast<http_status> (m.result_int ());
    r.version = http_version (static_cast<std::uint8_t> (m.version () / 10),
                              static_cast<std::uint8_t> (m.version () % 10));
    r.reason  = string_type (m.reason ());

    for (const auto& h: m)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    response_ = std::move (r);
  }

  template <typename S>
  asio::awaitable<std::size_t> basic_http_stream<S>::
  read_some (char* data, std::size_t size)
  {
    if (!parser_)
      throw std::logic_error ("HTTP stream is not open");

    co_return tls_
      ? co_await read_body (*tls_, data, size)
      : co_await read_body (*tcp_, data, size);
  }

  template <typename S>
  template <typename T>
  asio::awaitable<std::size_t> basic_http_stream<S>::
  read_body (T& s, char* data, std::size_t size)
  {
    namespace http = beast::http;

    auto& layer (beast::get_lowest_layer (s));

    // A single read may only consume framing (chunk headers, etc) without
    // producing any body bytes, so keep going until we either have some data
    // or the message is complete.
    //
    while (!parser_->is_done ())
    {
      auto& b (parser_->get ().body ());
      b.data = data;
      b.size = size;

      // Re-arm the timeout for every read so that it bounds the time between
      // bytes rather than the duration of the whole transfer.
      //
      expire (layer, request_timeout_);

      beast::error_code ec;
      co_await http::async_read_some (
        s, buffer_, *parser_, asio::redirect_error (asio::use_awaitable, ec));

      // need_buffer just means our buffer is full.
      //
      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec);

      std::size_t n (size - b.size);
      if (n != 0)
        co_return n;
    }

    co_return 0;
  }

  template <typename S>
  asio::awaitable<typename basic_http_stream<S>::string_type>
  basic_http_stream<S>::
  read_all (std::uint64_t limit)
  {
    string_type r;
    char buf[8192];

    for (;;)
    {
      std::size_t n (co_await read_some (buf, sizeof (buf)));

      if (n == 0)
        break;

      if (r.size () + n > limit)
        throw std::runtime_error ("HTTP response body exceeds " +
                                  std::to_string (limit) + " bytes");

      r.append (buf, n);
    }

    co_return r;
  }

  template <typename S>
  void basic_http_stream<S>::
  close () noexcept
  {
    // We don't perform the TLS shutdown: many servers never answer the
    // close_notify and waiting for them would stall until the timeout.
    //
    beast::error_code ec;

    if (tls_)
    {
      auto& sock (beast::get_lowest_layer (*tls_).socket ());
      if (sock.is_open ())
      {
        sock.shutdown (asio::ip::tcp::socket::shutdown_both, ec);
        sock.close (ec);
      }
    }

    if (tcp_)
    {
      auto& sock (tcp_->socket ());
      if (sock.is_open ())
      {
        sock.shutdown (asio::ip::tcp::socket::shutdown_both, ec);
        sock.close (ec);
      }
    }
  }
}
