#include <hfget/batch/batch-types.hxx>

#include <stdexcept>
#include <system_error>

using namespace std;

namespace hfget
{
  fs::path
  local_path (const file_entry& e, const fs::path& dir)
  {
    fs::path p (fs::path (e.path).lexically_normal ());

    if (p.empty () || p.is_absolute () || p.has_root_name ())
      throw invalid_argument ("invalid file path '" + e.path + "'");

    for (const fs::path& c: p)
    {
      if (c == "..")
        throw invalid_argument ("file path '" + e.path +
                                "' escapes the target directory");
    }

    return dir / p;
  }

  file_presence
  classify (const file_entry& e, const fs::path& dir)
  {
    fs::path p (local_path (e, dir));

    error_code ec;
    if (!fs::is_regular_file (p, ec))
      return file_presence::absent;

    uint64_t n (fs::file_size (p, ec));
    if (ec)
      return file_presence::absent;

    if (n == e.size)
      return file_presence::complete;

    return n == 0 ? file_presence::absent : file_presence::partial;
  }
}
