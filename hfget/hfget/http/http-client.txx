#include <utility>
#include <iostream>
#include <stdexcept>

#include <hfget/http/http-url.hxx>

namespace hfget
{
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    const auto& tr (session_->traits ());

    std::unique_ptr<stream_type> s (co_await open (std::move (req)));

    response_type r (s->response ());

    // The stream knows whether a body follows (it never does for HEAD).
    //
    r.body = co_await s->read_all (tr.max_body_size);

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<typename basic_http_client<T>::stream_type>>
  basic_http_client<T>::
  open_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    req.normalize (tr.user_agent);

    if (tr.verbosity >= 2)
    {
      std::cerr << "trace: " << req;

      if (auto r = req.get_header (string_type ("Range")))
        std::cerr << " (range " << *r << ')';

      std::cerr << std::endl;
    }

    auto s (std::make_unique<stream_type> (session_->io_context (),
                                           session_->ssl_context (),
                                           tr.connect_timeout,
                                           tr.request_timeout));

    co_await s->open (req);

    const response_type& r (s->response ());

    if (tr.verbosity >= 2)
      std::cerr << "trace: " << r << std::endl;

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        // We keep the method and headers (Range included) for the next hop.
        // The Host header, however, must be recomputed for the new location
        // or the CDN we usually get bounced to will reject the request.
        //
        request_type next (req.method,
                           string_type (resolve_location (req.url, *loc)),
                           req.version);

        next.headers = req.headers;
        next.headers.remove (string_type ("Host"));

        if (tr.verbosity >= 2)
          std::cerr << "trace: redirected to " << next.url << std::endl;

        // Drop the current connection before opening the next one.
        //
        s.reset ();

        co_return co_await open_impl (std::move (next), redirect_count + 1);
      }
    }

    co_return s;
  }
}
