#pragma once

#include <string>
#include <optional>
#include <filesystem>

#include <boost/json.hpp>

#include <hfget/hub/hub-types.hxx>
#include <hfget/batch/batch-types.hxx>

namespace hfget
{
  namespace fs = std::filesystem;

  // Record of a directory batch kept next to the downloaded files so that an
  // interrupted batch can be offered for resumption. Only the file set is
  // recorded: how far each file got is read off the disk.
  //
  // The JSON representation is:
  //
  // {
  //   "files": [{"path": "...", "url": "...", "size": 123}, ...],
  //   "save_directory": "...",
  //   "original_url": "..."
  // }
  //
  class batch_manifest
  {
  public:
    static constexpr const char* file_name = ".hfget-manifest.json";

    file_entries files;
    std::string  save_directory;
    std::string  original_url;

    batch_manifest () = default;

    batch_manifest (file_entries f, std::string dir, std::string url)
      : files (std::move (f)),
        save_directory (std::move (dir)),
        original_url (std::move (url)) {}

    // Parse the JSON representation. Throw std::runtime_error if it is
    // malformed.
    //
    explicit
    batch_manifest (const std::string& json);

    boost::json::value
    json () const;

    std::string
    string () const;

    // Manifest file path for the directory.
    //
    static fs::path
    path (const fs::path& dir)
    {
      return dir / file_name;
    }

    // Load the manifest from the directory. Return nullopt if there is none
    // and throw std::runtime_error if it cannot be read or parsed.
    //
    static std::optional<batch_manifest>
    load (const fs::path& dir);

    // Write the manifest into the directory creating it if necessary. Throw
    // std::runtime_error on failure.
    //
    void
    save (const fs::path& dir) const;

    // Remove the manifest from the directory. Return false if there was none.
    //
    static bool
    remove (const fs::path& dir);

    // Return the files that are not complete in the save directory.
    //
    file_entries
    pending () const;
  };
}
