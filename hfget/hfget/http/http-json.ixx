#include <stdexcept>

namespace hfget
{
  template <typename S>
  inline boost::json::value
  parse_json (const basic_http_response<S>& r)
  {
    if (!r.body)
      throw std::runtime_error ("HTTP response has no body to parse as JSON");

    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (*r.body, ec));

    if (ec)
      throw std::runtime_error ("invalid JSON in HTTP response: " +
                                ec.message ());

    return v;
  }

  template <typename T>
  inline boost::asio::awaitable<boost::json::value>
  basic_json_http_client<T>::
  get_json (const string_type& url)
  {
    request_type req (http_method::get, url);
    req.set_header (string_type ("Accept"), string_type ("application/json"));

    response_type res (co_await client_.request (std::move (req)));

    if (!res.is_success ())
      throw std::runtime_error ("HTTP " + std::to_string (res.status_code ()) +
                                " " + to_string (res.status));

    co_return parse_json (res);
  }
}
