#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>
#include <cstdint>

#include <hfget/http/http-types.hxx>

namespace hfget
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;  // Status reason phrase.
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s,
                         http_version v = http_version (1, 1))
      : status (s), version (v) {}

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
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

    std::optional<string_type>
    content_type () const
    {
      return get_header (string_type ("Content-Type"));
    }

    // Return the parsed Content-Length header or nullopt if it is absent or
    // not a valid number.
    //
    std::optional<std::uint64_t>
    content_length () const;

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    o << r.version << ' ' << static_cast<std::uint16_t> (r.status);

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string, std::string>;
}

#include <hfget/http/http-response.ixx>
