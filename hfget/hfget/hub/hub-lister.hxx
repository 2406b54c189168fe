#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <hfget/hub/hub-types.hxx>
#include <hfget/hub/hub-endpoint.hxx>
#include <hfget/http/http-json.hxx>

namespace hfget
{
  // Repository directory lister.
  //
  // Query the tree API for the directory and return the files it contains
  // directly. Subdirectories are not descended into. The result is either
  // the complete list or nothing: on any failure (network error, non-2xx
  // status, unexpected JSON) nullopt is returned and the reason is available
  // from last_error().
  //
  class hub_lister
  {
  public:
    using traits_type = http_client_traits<>;

    static constexpr std::uint32_t default_timeout = 30000; // ms

    hub_lister (boost::asio::io_context&,
                hub_endpoint,
                traits_type = traits_type (),
                std::uint32_t timeout = default_timeout);

    boost::asio::awaitable<std::optional<file_entries>>
    list_files (const repo_coordinates&);

    // Convert the tree API reply into file entries. Throw
    // std::invalid_argument if the document does not have the expected
    // shape.
    //
    file_entries
    parse_tree (const repo_coordinates&, const boost::json::value&) const;

    const std::string&
    last_error () const noexcept
    {
      return last_error_;
    }

  private:
    hub_endpoint endpoint_;
    json_http_client client_;
    std::string last_error_;
  };
}
