#include <hfget/http/http-url.hxx>

namespace hfget
{
  // The HTTP request line requires just the path (and query), not the full
  // absolute URI.
  //
  template <typename S>
  inline typename basic_http_request<S>::string_type
  basic_http_request<S>::
  target () const
  {
    return string_type (parse_url (url).target);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    // Required by HTTP/1.1. Note that the port must be included if it is not
    // the default one for the scheme, otherwise virtual hosting on
    // non-standard ports breaks.
    //
    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));

      if (!p.host.empty ())
      {
        string_type h (p.host);

        if (!((p.scheme == "https" && p.port == "443") ||
              (p.scheme == "http" && p.port == "80")))
          h += string_type (":") + string_type (p.port);

        set_header (string_type ("Host"), std::move (h));
      }
    }

    if (!has_header (string_type ("User-Agent")) && !ua.empty ())
      set_user_agent (ua);
  }
}
