#include <algorithm>
#include <cctype>

namespace assist
{
  template <typename S>
  inline bool
  http_field_name_equal (const S& x, const S& y)
  {
    if (x.size () != y.size ())
      return false;

    for (typename S::size_type i (0); i != x.size (); ++i)
    {
      if (std::tolower (static_cast<unsigned char> (x[i])) !=
          std::tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
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
    for (const field_type& f : fields)
    {
      if (http_field_name_equal (f.first, n))
        return f.second;
    }

    return std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return http_field_name_equal (f.first, n);
                                  }),
                  fields.end ());
  }
}
