#pragma once

#include <string>
#include <cstdlib>

#include <hfget/hub/hub-types.hxx>
#include <hfget/http/http-url.hxx>

namespace hfget
{
  // Model hub endpoint builder.
  //
  // Constructs download and listing URLs on the mirror following the
  // patterns:
  //
  // <base>/[datasets/]<owner>/<name>/resolve/<branch>/<path>
  // <base>/api/{models|datasets}/<owner>/<name>/tree/<branch>[/<subpath>]
  //
  class hub_endpoint
  {
  public:
    static constexpr const char* default_base   = "https://hf-mirror.com";
    static constexpr const char* mirror_host    = "hf-mirror.com";
    static constexpr const char* canonical_host = "huggingface.co";

    // Environment variable overriding the default base.
    //
    static constexpr const char* environment_variable = "HF_ENDPOINT";

    hub_endpoint ()
      : base_ (default_base) {}

    explicit
    hub_endpoint (std::string base)
      : base_ (std::move (base))
    {
      while (!base_.empty () && base_.back () == '/')
        base_.pop_back ();

      if (base_.empty ())
        base_ = default_base;
    }

    // Use the base from HF_ENDPOINT if set and not empty, the default
    // otherwise.
    //
    static hub_endpoint
    from_environment ()
    {
      const char* v (std::getenv (environment_variable));
      return v != nullptr && *v != '\0' ? hub_endpoint (v) : hub_endpoint ();
    }

    const std::string&
    base () const noexcept
    {
      return base_;
    }

    // Host (with port if not the default) of the configured base.
    //
    std::string
    host () const
    {
      url_parts p (parse_url (base_));
      std::string o (p.origin ());
      return o.substr (o.find ("://") + 3);
    }

    std::string
    resolve_url (const repo_coordinates& c, const std::string& path) const
    {
      return base_ + repo_prefix (c) + c.owner + '/' + c.name +
        "/resolve/" + c.branch + '/' + path;
    }

    std::string
    tree_api_url (const repo_coordinates& c) const
    {
      std::string r (base_ + "/api/" +
                     (c.kind == repo_kind::dataset ? "datasets" : "models") +
                     '/' + c.owner + '/' + c.name + "/tree/" + c.branch);

      if (!c.subpath.empty ())
        r += '/' + c.subpath;

      return r;
    }

  private:
    static const char*
    repo_prefix (const repo_coordinates& c)
    {
      return c.kind == repo_kind::dataset ? "/datasets/" : "/";
    }

  private:
    std::string base_;
  };
}
