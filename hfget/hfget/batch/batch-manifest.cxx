#include <hfget/batch/batch-manifest.hxx>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace hfget
{
  namespace json = boost::json;

  batch_manifest::
  batch_manifest (const std::string& s)
  {
    try
    {
      json::value jv (json::parse (s));

      if (!jv.is_object ())
        throw invalid_argument ("manifest JSON must be an object");

      const json::object& o (jv.as_object ());

      save_directory = json::value_to<std::string> (o.at ("save_directory"));
      original_url = json::value_to<std::string> (o.at ("original_url"));

      for (const json::value& v: o.at ("files").as_array ())
      {
        const json::object& fo (v.as_object ());

        files.emplace_back (json::value_to<std::string> (fo.at ("path")),
                            json::value_to<std::string> (fo.at ("url")),
                            json::value_to<uint64_t> (fo.at ("size")));
      }
    }
    catch (const exception& e)
    {
      throw runtime_error (std::string ("failed to parse manifest: ") +
                           e.what ());
    }
  }

  json::value batch_manifest::
  json () const
  {
    json::array a;

    for (const file_entry& f: files)
    {
      a.push_back (json::object {{"path", f.path},
                                  {"url", f.url},
                                  {"size", f.size}});
    }

    return json::object {{"files", move (a)},
                         {"save_directory", save_directory},
                         {"original_url", original_url}};
  }

  std::string batch_manifest::
  string () const
  {
    return json::serialize (json ());
  }

  optional<batch_manifest> batch_manifest::
  load (const fs::path& dir)
  {
    fs::path f (path (dir));

    error_code ec;
    if (!fs::exists (f, ec))
      return nullopt;

    ifstream is (f);
    if (!is)
      throw runtime_error ("unable to open manifest " + f.string ());

    std::string s ((istreambuf_iterator<char> (is)),
                   istreambuf_iterator<char> ());

    if (is.bad ())
      throw runtime_error ("unable to read manifest " + f.string ());

    return batch_manifest (s);
  }

  void batch_manifest::
  save (const fs::path& dir) const
  {
    error_code ec;
    fs::create_directories (dir, ec);

    if (ec)
      throw runtime_error ("unable to create " + dir.string () + ": " +
                           ec.message ());

    fs::path f (path (dir));

    ofstream os (f);
    if (!os)
      throw runtime_error ("unable to create manifest " + f.string ());

    os << string ();

    os.close ();
    if (!os)
      throw runtime_error ("unable to write manifest " + f.string ());
  }

  bool batch_manifest::
  remove (const fs::path& dir)
  {
    error_code ec;
    bool r (fs::remove (path (dir), ec));

    if (ec)
      throw runtime_error ("unable to remove manifest: " + ec.message ());

    return r;
  }

  file_entries batch_manifest::
  pending () const
  {
    file_entries r;

    // An entry with an unusable path stays pending: the batch will report it
    // as failed.
    //
    for (const file_entry& f: files)
    {
      bool c (false);
      try
      {
        c = classify (f, save_directory) == file_presence::complete;
      }
      catch (const invalid_argument&) {}

      if (!c)
        r.push_back (f);
    }

    return r;
  }
}
