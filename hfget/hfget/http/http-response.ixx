#include <charconv>

namespace hfget
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto cl (get_header (string_type ("Content-Length")));

    if (!cl || cl->empty ())
      return std::nullopt;

    std::uint64_t n (0);
    const char* e (cl->data () + cl->size ());
    auto r (std::from_chars (cl->data (), e, n));

    // Trailing garbage means the header is not something we can trust.
    //
    if (r.ec != std::errc () || r.ptr != e)
      return std::nullopt;

    return n;
  }
}
