#pragma once

#include <string>
#include <cstddef>
#include <ostream>
#include <filesystem>

#include <hfget/hub/hub-types.hxx>

namespace hfget
{
  namespace fs = std::filesystem;

  // What we already have locally of a batch file.
  //
  enum class file_presence
  {
    complete, // Local size equals the declared size.
    partial,  // Some bytes are there.
    absent    // Nothing (or an empty file where content is expected).
  };

  inline std::ostream&
  operator<< (std::ostream& os, file_presence p)
  {
    switch (p)
    {
    case file_presence::complete: return os << "complete";
    case file_presence::partial:  return os << "partial";
    case file_presence::absent:   return os << "absent";
    }
    return os;
  }

  // Return the local path of the entry inside the directory. Throw
  // std::invalid_argument if the entry path is absolute or would escape the
  // directory.
  //
  fs::path
  local_path (const file_entry&, const fs::path& dir);

  // Compare the local file against the entry's declared size. An entry with
  // an unknown (0) size is complete only if an empty file is there.
  //
  file_presence
  classify (const file_entry&, const fs::path& dir);

  // Outcome of a batch.
  //
  struct batch_summary
  {
    std::size_t total     {0};
    std::size_t completed {0}; // Fetched (fully or the remainder).
    std::size_t skipped   {0}; // Already complete locally.
    std::size_t failed    {0};
    bool        cancelled {false};

    // True if every file ended up complete.
    //
    bool
    success () const noexcept
    {
      return !cancelled && failed == 0 && completed + skipped == total;
    }

    explicit
    operator bool () const noexcept
    {
      return success ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const batch_summary& s)
  {
    return os << s.completed << " downloaded, "
              << s.skipped << " skipped, "
              << s.failed << " failed of " << s.total;
  }
}
