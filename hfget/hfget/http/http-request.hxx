#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>
#include <cstdint>

#include <hfget/http/http-types.hxx>

namespace hfget
{
  // HTTP request. Only GET and HEAD are sent so there is no body.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () : method (http_method::get) {}

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    basic_http_request (http_method m,
                        string_type u,
                        headers_type h,
                        http_version v = http_version (1, 1))
        : method (m),
          url (std::move (u)),
          version (v),
          headers (std::move (h)) {}

    // Get the request target (path and query component of the URL).
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_user_agent (string_type ua)
    {
      set_header (string_type ("User-Agent"), std::move (ua));
    }

    // Request the byte range [offset, end of resource).
    //
    void
    set_range (std::uint64_t offset)
    {
      set_header (string_type ("Range"),
                  string_type ("bytes=") +
                  string_type (std::to_string (offset)) +
                  string_type ("-"));
    }

    void
    clear_range ()
    {
      headers.remove (string_type ("Range"));
    }

    bool
    has_range () const
    {
      return has_header (string_type ("Range"));
    }

    // Fill in Host and User-Agent unless already present.
    //
    void
    normalize (const string_type& user_agent);

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <hfget/http/http-request.ixx>
