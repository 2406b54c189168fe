#include <cassert>
#include <string>
#include <optional>
#include <stdexcept>

#include <hfget/hub/hub-types.hxx>
#include <hfget/batch/batch-types.hxx>
#include <hfget/batch/batch-manifest.hxx>
#include <hfget/testing/test-server.hxx>

using namespace std;
using namespace hfget;
using namespace hfget::testing;

static bool
parse_fails (const string& s)
{
  try
  {
    batch_manifest m (s);
    return false;
  }
  catch (const runtime_error& e)
  {
    assert (string (e.what ()).find ("failed to parse manifest") == 0);
    return true;
  }
}

static void
test_save_load ()
{
  temp_dir tmp;
  fs::path d (tmp.path () / "out");

  assert (!batch_manifest::load (d));

  batch_manifest m ({{"a.bin", "https://h/o/n/resolve/main/a.bin", 10},
                     {"sub/b.txt", "https://h/o/n/resolve/main/sub/b.txt", 0}},
                    d.string (),
                    "https://hf-mirror.com/o/n/tree/main");

  m.save (d);
  assert (fs::exists (batch_manifest::path (d)));
  assert (batch_manifest::path (d).filename () == ".hfget-manifest.json");

  optional<batch_manifest> l (batch_manifest::load (d));
  assert (l);
  assert (l->files == m.files);
  assert (l->save_directory == m.save_directory);
  assert (l->original_url == m.original_url);

  assert (batch_manifest::remove (d));
  assert (!batch_manifest::remove (d));
  assert (!batch_manifest::load (d));
}

static void
test_malformed ()
{
  assert (parse_fails ("{"));
  assert (parse_fails ("[]"));
  assert (parse_fails (R"({"files": [], "save_directory": "x"})"));
  assert (parse_fails (
    R"({"files": [{"path": "a"}], "save_directory": "x", "original_url": "u"})"));

  temp_dir tmp;
  write_file (batch_manifest::path (tmp.path ()), "garbage");

  bool thrown (false);
  try
  {
    batch_manifest::load (tmp.path ());
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_classify ()
{
  temp_dir tmp;
  const fs::path& d (tmp.path ());

  file_entry a ("a.bin", "u", 4);
  file_entry b ("sub/b.bin", "u", 4);
  file_entry c ("c.bin", "u", 4);
  file_entry e ("e.bin", "u", 4);

  write_file (d / "a.bin", "abcd");
  write_file (d / "sub" / "b.bin", "ab");
  write_file (d / "e.bin", "");

  assert (classify (a, d) == file_presence::complete);
  assert (classify (b, d) == file_presence::partial);
  assert (classify (c, d) == file_presence::absent);
  assert (classify (e, d) == file_presence::absent);

  // A directory where the file should be.
  //
  fs::create_directories (d / "x.bin");
  assert (classify (file_entry ("x.bin", "u", 4), d) == file_presence::absent);

  // Paths that would escape the directory.
  //
  for (const char* p: {"../up.bin", "a/../../up.bin", "/abs.bin", ""})
  {
    bool thrown (false);
    try
    {
      local_path (file_entry (p, "u", 1), d);
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
  }

  assert (local_path (file_entry ("a/./b.bin", "u", 1), d) == d / "a/b.bin");

  // Pending is everything that is not complete.
  //
  batch_manifest m ({a, b, c, e, file_entry ("../bad", "u", 1)},
                    d.string (),
                    "url");

  file_entries p (m.pending ());
  assert (p.size () == 4);
  assert (p[0].path == "sub/b.bin");
  assert (p[3].path == "../bad");
}

int
main ()
{
  test_save_load ();
  test_malformed ();
  test_classify ();
}
