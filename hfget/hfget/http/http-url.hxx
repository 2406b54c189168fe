#pragma once

#include <string>

namespace hfget
{
  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path and query, always starts with '/'.

    // Return scheme://host[:port] omitting the port if it is the default one
    // for the scheme.
    //
    std::string
    origin () const;
  };

  // Parse a simple URL string into its components.
  //
  // Note that we are doing this manually here to avoid introducing a
  // dependency on a full-blown URI library. This handles the standard
  // scheme://host:port/path format but will not cope with IPv6 literals or
  // user info. Neither shows up in model hub URLs.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL of the request that
  // produced it. Absolute locations are returned as is, origin-relative ones
  // ("/path") are joined with the request's origin, and anything else is
  // resolved against the request's directory.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // Strip the query and fragment components.
  //
  std::string
  strip_query (const std::string&);

  // Decode %XX escapes. Malformed escapes are passed through verbatim.
  //
  std::string
  percent_decode (const std::string&);

  // Return the last segment of the percent-decoded URL path. Return empty
  // string if the path ends with a slash.
  //
  std::string
  url_basename (const std::string&);
}
