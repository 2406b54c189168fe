#include <hfget/http/http-url.hxx>

#include <cctype>

using namespace std;

namespace hfget
{
  string url_parts::
  origin () const
  {
    string r (scheme + "://" + host);

    if (!((scheme == "https" && port == "443") ||
          (scheme == "http" && port == "80")))
      r += ':' + port;

    return r;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Scheme. Fallback to http if none is specified.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;

      for (char& c: r.scheme)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }
    else
      r.scheme = "http";

    // Authority (host:port) ends at the first slash, question mark, or the
    // end of the string.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = (r.scheme == "https") ? "443" : "80";
    }

    // Target (path + query). The fragment never goes on the wire.
    //
    string t (end < url.size () ? url.substr (end) : string ());

    if (size_t h = t.find ('#'); h != string::npos)
      t.resize (h);

    if (t.empty () || t.front () != '/')
      t.insert (0, 1, '/');

    r.target = move (t);
    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));

    // Scheme-relative (//host/path).
    //
    if (loc.compare (0, 2, "//") == 0)
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc.front () == '/')
      return b.origin () + loc;

    // Relative to the directory of the base target.
    //
    string d (strip_query (b.target));
    d.resize (d.rfind ('/') + 1);

    return b.origin () + d + loc;
  }

  string
  strip_query (const string& url)
  {
    size_t p (url.find_first_of ("?#"));
    return p != string::npos ? url.substr (0, p) : url;
  }

  string
  percent_decode (const string& s)
  {
    auto hex = [] (char c) -> int
    {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    };

    string r;
    r.reserve (s.size ());

    for (size_t i (0); i < s.size (); ++i)
    {
      if (s[i] == '%' && i + 2 < s.size ())
      {
        int h (hex (s[i + 1])), l (hex (s[i + 2]));

        if (h >= 0 && l >= 0)
        {
          r += static_cast<char> (h * 16 + l);
          i += 2;
          continue;
        }
      }

      r += s[i];
    }

    return r;
  }

  string
  url_basename (const string& url)
  {
    // Decode before splitting so that an encoded separator cannot smuggle a
    // directory component into the result.
    //
    string p (percent_decode (parse_url (strip_query (url)).target));
    return p.substr (p.rfind ('/') + 1);
  }
}
