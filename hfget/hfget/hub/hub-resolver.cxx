#include <hfget/hub/hub-resolver.hxx>

#include <cctype>
#include <algorithm>

#include <hfget/http/http-url.hxx>

using namespace std;

namespace hfget
{
  static string
  regex_escape (const string& s)
  {
    string r;

    for (char c: s)
    {
      if (string ("\\^$.|?*+()[]{}").find (c) != string::npos)
        r += '\\';

      r += c;
    }

    return r;
  }

  static string
  trim (const string& s)
  {
    auto ws = [] (char c) {return isspace (static_cast<unsigned char> (c));};

    auto b (find_if_not (s.begin (), s.end (), ws));
    auto e (find_if_not (s.rbegin (), s.rend (), ws).base ());

    return b < e ? string (b, e) : string ();
  }

  // Return the name to save under, the default if the decoded basename is
  // not usable as a plain file name.
  //
  static string
  file_name (const string& n)
  {
    return n.empty () || n == "." || n == ".."
      ? string (hub_resolver::default_filename)
      : n;
  }

  hub_resolver::
  hub_resolver (hub_endpoint e)
    : endpoint_ (move (e))
  {
    vector<string> hs {hub_endpoint::mirror_host,
                       hub_endpoint::canonical_host};

    string h (endpoint_.host ());
    transform (h.begin (), h.end (), h.begin (),
               [] (char c) {return static_cast<char> (tolower (c));});

    if (find (hs.begin (), hs.end (), h) == hs.end ())
      hs.push_back (h);

    string alt;
    for (const string& x: hs)
    {
      if (!alt.empty ())
        alt += '|';

      alt += regex_escape (x);
    }

    // Groups: 1 datasets prefix, 2 owner, 3 name, 4 branch, 5 path. The
    // scheme may be omitted.
    //
    string p ("^(?:https?://)?(?:www\\.)?(?:" + alt +
              ")/(datasets/)?([^/]+)/([^/]+)");

    auto flags (regex::ECMAScript | regex::icase);

    patterns_.push_back (
      pattern {pattern_kind::tree,
               regex (p + "/tree/([^/]+)(?:/(.*))?$", flags)});

    patterns_.push_back (
      pattern {pattern_kind::file,
               regex (p + "/(?:resolve|blob)/([^/]+)/(.+)$", flags)});
  }

  hub_reference hub_resolver::
  resolve (const string& raw) const
  {
    string u (strip_query (trim (raw)));

    for (const pattern& p: patterns_)
    {
      smatch m;
      if (!regex_match (u, m, p.re))
        continue;

      repo_coordinates c (m[2].str (), m[3].str ());
      c.kind = m[1].matched ? repo_kind::dataset : repo_kind::model;

      switch (p.kind)
      {
      case pattern_kind::tree:
        {
          c.branch = m[4].str ();

          string s (m[5].matched ? m[5].str () : string ());
          while (!s.empty () && s.back () == '/')
            s.pop_back ();

          c.subpath = move (s);
          return directory_ref {move (c)};
        }
      case pattern_kind::file:
        {
          c.branch = m[4].str ();

          string path (m[5].str ());
          string d (percent_decode (path));

          return single_file_ref {endpoint_.resolve_url (c, path),
                                  file_name (d.substr (d.rfind ('/') + 1))};
        }
      }
    }

    // Opaque direct URL.
    //
    if (u.compare (0, 4, "http") == 0)
    {
      string n (file_name (url_basename (u)));
      return single_file_ref {move (u), move (n)};
    }

    return unresolved_ref {};
  }
}
