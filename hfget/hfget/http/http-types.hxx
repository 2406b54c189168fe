#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <boost/system/error_code.hpp>

namespace hfget
{
  // We only ever fetch: HEAD for the size, GET for the body or a listing.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Status codes a hub or its CDN answers a download with. Anything else is
  // still representable (the enum is just a number) but has no name.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return the reason phrase or "Unknown".
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Header list in wire order. Names compare case-insensitively.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;

    struct field_type
    {
      string_type name;
      string_type value;
    };

    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace all fields called name with a single one.
    //
    void
    set (string_type name, string_type value);

    // Append, keeping any existing fields with the same name (a response may
    // repeat a header).
    //
    void
    add (string_type name, string_type value)
    {
      fields.push_back (field_type {std::move (name), std::move (value)});
    }

    // Return the value of the first field called name.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return find (name) != fields.end ();
    }

    void
    remove (const string_type& name);

    typename fields_type::const_iterator
    begin () const noexcept {return fields.begin ();}

    typename fields_type::const_iterator
    end () const noexcept {return fields.end ();}

  private:
    typename fields_type::const_iterator
    find (const string_type&) const;
  };

  using http_headers = basic_http_headers<std::string>;

  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    // "HTTP/1.1".
    //
    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // Return true if the error denotes a network-level failure that is likely
  // to go away if the request is simply repeated (connection reset, timeout,
  // truncated body, and so on). Authoritative answers from the server (HTTP
  // error statuses) are never transient in this sense.
  //
  bool
  is_transient (const boost::system::error_code&);
}

#include <hfget/http/http-types.ixx>
