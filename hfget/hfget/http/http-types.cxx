#include <hfget/http/http-types.hxx>

#include <sstream>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

using namespace std;

namespace hfget
{
  string
  to_string (http_method m)
  {
    return m == http_method::head ? "HEAD" : "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
    case http_status::ok:                    return "OK";
    case http_status::partial_content:       return "Partial Content";
    case http_status::moved_permanently:     return "Moved Permanently";
    case http_status::found:                 return "Found";
    case http_status::see_other:             return "See Other";
    case http_status::temporary_redirect:    return "Temporary Redirect";
    case http_status::permanent_redirect:    return "Permanent Redirect";
    case http_status::unauthorized:          return "Unauthorized";
    case http_status::forbidden:             return "Forbidden";
    case http_status::not_found:             return "Not Found";
    case http_status::range_not_satisfiable: return "Range Not Satisfiable";
    case http_status::too_many_requests:     return "Too Many Requests";
    case http_status::internal_server_error: return "Internal Server Error";
    case http_status::bad_gateway:           return "Bad Gateway";
    case http_status::service_unavailable:   return "Service Unavailable";
    case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "Unknown";
  }

  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }

  bool
  is_transient (const boost::system::error_code& ec)
  {
    namespace asio  = boost::asio;
    namespace beast = boost::beast;

    if (!ec)
      return false;

    // Timeouts armed on the beast::tcp_stream come back as beast's own error
    // rather than the system one.
    //
    if (ec == beast::error::timeout)
      return true;

    // The peer closed the connection before the message was complete. This
    // is what a dropped download looks like from the parser's point of view.
    //
    if (ec == beast::http::error::partial_message ||
        ec == beast::http::error::end_of_stream)
      return true;

    // Servers that close without a TLS close_notify.
    //
    if (ec == asio::ssl::error::stream_truncated)
      return true;

    return ec == asio::error::eof                       ||
           ec == asio::error::connection_reset          ||
           ec == asio::error::connection_aborted        ||
           ec == asio::error::connection_refused        ||
           ec == asio::error::broken_pipe               ||
           ec == asio::error::timed_out                 ||
           ec == asio::error::network_down              ||
           ec == asio::error::network_reset             ||
           ec == asio::error::network_unreachable       ||
           ec == asio::error::host_unreachable          ||
           ec == asio::error::host_not_found            ||
           ec == asio::error::host_not_found_try_again  ||
           ec == asio::error::try_again;
  }
}
