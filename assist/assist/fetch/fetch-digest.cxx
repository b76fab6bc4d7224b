#include <assist/fetch/fetch-digest.hxx>

#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

using namespace std;

namespace assist
{
  namespace
  {
    struct md_ctx_deleter
    {
      void
      operator() (EVP_MD_CTX* c) const noexcept
      {
        EVP_MD_CTX_free (c);
      }
    };

    using md_ctx = unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

    md_ctx
    sha256_init ()
    {
      md_ctx c (EVP_MD_CTX_new ());

      if (!c || EVP_DigestInit_ex (c.get (), EVP_sha256 (), nullptr) != 1)
        throw runtime_error ("unable to initialize SHA-256 digest");

      return c;
    }

    string
    sha256_final (EVP_MD_CTX* c)
    {
      unsigned char h[EVP_MAX_MD_SIZE];
      unsigned int n (0);

      if (EVP_DigestFinal_ex (c, h, &n) != 1)
        throw runtime_error ("unable to finalize SHA-256 digest");

      static const char hex[] = "0123456789abcdef";

      string r;
      r.reserve (n * 2);
      for (unsigned int i (0); i < n; ++i)
      {
        r += hex[h[i] >> 4];
        r += hex[h[i] & 0x0f];
      }

      return r;
    }
  }

  string
  sha256_file (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + f.string () + " for reading");

    md_ctx c (sha256_init ());

    char buf[65536];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
    {
      if (EVP_DigestUpdate (c.get (),
                            buf,
                            static_cast<size_t> (ifs.gcount ())) != 1)
        throw runtime_error ("unable to update SHA-256 digest");
    }

    if (ifs.bad ())
      throw runtime_error ("unable to read " + f.string ());

    return sha256_final (c.get ());
  }

  string
  sha256_string (const string& s)
  {
    md_ctx c (sha256_init ());

    if (EVP_DigestUpdate (c.get (), s.data (), s.size ()) != 1)
      throw runtime_error ("unable to update SHA-256 digest");

    return sha256_final (c.get ());
  }

  bool
  compare_digests (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }
}
