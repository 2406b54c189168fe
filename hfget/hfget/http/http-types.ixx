#include <algorithm>
#include <cctype>

namespace hfget
{
  // RFC 7230, section 3.2: field names are case-insensitive.
  //
  template <typename S>
  inline bool
  header_name_equal (const S& x, const S& y)
  {
    auto lower ([] (char c)
    {
      return std::tolower (static_cast<unsigned char> (c));
    });

    return x.size () == y.size () &&
           std::equal (x.begin (), x.end (), y.begin (),
                       [&lower] (char a, char b)
                       {
                         return lower (a) == lower (b);
                       });
  }

  template <typename S>
  inline typename basic_http_headers<S>::fields_type::const_iterator
  basic_http_headers<S>::
  find (const string_type& n) const
  {
    return std::find_if (fields.begin (), fields.end (),
                         [&n] (const field_type& f)
                         {
                           return header_name_equal (f.name, n);
                         });
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    add (std::move (n), std::move (v));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    auto i (find (n));

    if (i == fields.end ())
      return std::nullopt;

    return i->value;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    std::erase_if (fields,
                   [&n] (const field_type& f)
                   {
                     return header_name_equal (f.name, n);
                   });
  }
}
