#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <ostream>

namespace hfget
{
  // Model hub data types.
  //

  // Repository kind. Datasets live under a separate URL and API namespace.
  //
  enum class repo_kind
  {
    model,
    dataset
  };

  std::string
  to_string (repo_kind);

  inline std::ostream&
  operator<< (std::ostream& o, repo_kind k)
  {
    return o << to_string (k);
  }

  // Location of a directory inside a repository revision.
  //
  struct repo_coordinates
  {
    repo_kind   kind = repo_kind::model;
    std::string owner;
    std::string name;
    std::string branch = "main";
    std::string subpath; // Relative to the repository root, may be empty.

    repo_coordinates () = default;

    repo_coordinates (std::string o,
                      std::string n,
                      std::string b = "main",
                      std::string s = std::string ())
      : owner (std::move (o)),
        name (std::move (n)),
        branch (std::move (b)),
        subpath (std::move (s)) {}

    // Return owner/name.
    //
    std::string
    id () const
    {
      return owner + '/' + name;
    }

    bool
    empty () const noexcept
    {
      return owner.empty () || name.empty ();
    }
  };

  inline bool
  operator== (const repo_coordinates& x, const repo_coordinates& y)
  {
    return x.kind == y.kind     &&
           x.owner == y.owner   &&
           x.name == y.name     &&
           x.branch == y.branch &&
           x.subpath == y.subpath;
  }

  inline bool
  operator!= (const repo_coordinates& x, const repo_coordinates& y)
  {
    return !(x == y);
  }

  std::ostream&
  operator<< (std::ostream&, const repo_coordinates&);

  // A file to be fetched as part of a batch.
  //
  struct file_entry
  {
    std::string   path; // Relative to the save directory.
    std::string   url;
    std::uint64_t size = 0; // Declared size, 0 if unknown.

    file_entry () = default;

    file_entry (std::string p, std::string u, std::uint64_t s)
      : path (std::move (p)), url (std::move (u)), size (s) {}
  };

  inline bool
  operator== (const file_entry& x, const file_entry& y)
  {
    return x.path == y.path && x.url == y.url && x.size == y.size;
  }

  using file_entries = std::vector<file_entry>;

  // Result of URL resolution.
  //
  struct single_file_ref
  {
    std::string url;      // Direct download URL.
    std::string filename; // Inferred local file name.
  };

  struct directory_ref
  {
    repo_coordinates repo;
  };

  struct unresolved_ref
  {
  };

  using hub_reference = std::variant<unresolved_ref,
                                     single_file_ref,
                                     directory_ref>;
}
