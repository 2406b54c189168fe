#pragma once

#include <string>
#include <regex>
#include <vector>

#include <hfget/hub/hub-types.hxx>
#include <hfget/hub/hub-endpoint.hxx>

namespace hfget
{
  // Classify a user-supplied URL.
  //
  // Directory ("tree") URLs yield repository coordinates. Single-file
  // ("resolve" or "blob") URLs yield a direct download URL on the configured
  // mirror, whichever of the known hosts they came from. Anything else
  // starting with "http" is taken as an opaque direct URL. The rest is
  // unresolved. The file name is always a single path component.
  //
  // The recognized hosts are the default mirror, the canonical hub, and the
  // host of the configured endpoint.
  //
  class hub_resolver
  {
  public:
    // Name used when an opaque URL has no usable basename.
    //
    static constexpr const char* default_filename = "downloaded_file";

    explicit
    hub_resolver (hub_endpoint = hub_endpoint ());

    hub_reference
    resolve (const std::string& url) const;

    const hub_endpoint&
    endpoint () const noexcept
    {
      return endpoint_;
    }

  private:
    enum class pattern_kind
    {
      tree,
      file
    };

    struct pattern
    {
      pattern_kind kind;
      std::regex   re;
    };

    hub_endpoint endpoint_;

    // Ordered: the directory pattern comes before the file pattern since a
    // deep tree URL also contains something that looks like a file path.
    //
    std::vector<pattern> patterns_;
  };
}
