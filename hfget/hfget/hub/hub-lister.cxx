#include <hfget/hub/hub-lister.hxx>

#include <exception>
#include <stdexcept>
#include <iostream>

using namespace std;

namespace hfget
{
  namespace json = boost::json;

  static http_client_traits<>
  lister_traits (http_client_traits<> t, uint32_t timeout)
  {
    if (t.request_timeout == 0 || t.request_timeout > timeout)
      t.request_timeout = timeout;

    return t;
  }

  hub_lister::
  hub_lister (asio::io_context& ioc,
              hub_endpoint e,
              traits_type t,
              uint32_t timeout)
    : endpoint_ (move (e)),
      client_ (ioc, lister_traits (move (t), timeout))
  {
  }

  file_entries hub_lister::
  parse_tree (const repo_coordinates& c, const json::value& v) const
  {
    const json::array* a (v.if_array ());
    if (a == nullptr)
      throw invalid_argument ("tree listing is not a JSON array");

    file_entries r;

    for (const json::value& x: *a)
    {
      const json::object* o (x.if_object ());
      if (o == nullptr)
        throw invalid_argument ("tree listing entry is not a JSON object");

      const json::value* t (o->if_contains ("type"));
      const json::value* p (o->if_contains ("path"));

      if (t == nullptr || !t->is_string () ||
          p == nullptr || !p->is_string ())
        throw invalid_argument ("tree listing entry without type or path");

      if (t->get_string () != "file")
        continue;

      string path (p->get_string ());

      uint64_t size (0);
      if (const json::value* s = o->if_contains ("size"))
      {
        if (s->is_uint64 ())
          size = s->get_uint64 ();
        else if (s->is_int64 () && s->get_int64 () >= 0)
          size = static_cast<uint64_t> (s->get_int64 ());
      }

      string url (endpoint_.resolve_url (c, path));
      r.emplace_back (move (path), move (url), size);
    }

    return r;
  }

  asio::awaitable<optional<file_entries>> hub_lister::
  list_files (const repo_coordinates& c)
  {
    last_error_.clear ();

    string url (endpoint_.tree_api_url (c));

    const auto& tr (client_.client ().session ().traits ());

    if (tr.verbosity >= 1)
      cerr << "info: listing " << url << endl;

    try
    {
      json::value v (co_await client_.get_json (url));
      co_return parse_tree (c, v);
    }
    catch (const exception& e)
    {
      last_error_ = e.what ();
    }

    co_return nullopt;
  }
}
