#include <openssl/ssl.h>

namespace hfget
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);

    // SNI is set per connection by the stream.
    //
    SSL_CTX_set_tlsext_servername_callback (ssl_ctx_.native_handle (), nullptr);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    co_return co_await request (request_type (http_method::get, url));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    co_return co_await request (request_type (http_method::head, url));
  }

  template <typename T>
  inline asio::awaitable<std::unique_ptr<typename basic_http_client<T>::stream_type>>
  basic_http_client<T>::
  open (request_type req)
  {
    co_return co_await open_impl (std::move (req), 0);
  }
}
