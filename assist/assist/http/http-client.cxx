#include <assist/http/http-client.hxx>

#ifdef _WIN32
#  include <windows.h>
#  include <wincrypt.h>
#endif

#include <system_error>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

using namespace std;

namespace assist
{
  void
  load_system_certificates (ssl::context& c)
  {
    c.set_default_verify_paths ();

#ifdef _WIN32
    // OpenSSL has no default certificate location on Windows, so import
    // the system ROOT store into the context's X509 store.
    //
    HCERTSTORE s (CertOpenSystemStoreW (0, L"ROOT"));
    if (s == nullptr)
      throw system_error (static_cast<int> (GetLastError ()),
                          system_category (),
                          "unable to open system certificate store");

    X509_STORE* xs (SSL_CTX_get_cert_store (c.native_handle ()));

    PCCERT_CONTEXT p (nullptr);
    while ((p = CertEnumCertificatesInStore (s, p)) != nullptr)
    {
      const unsigned char* d (p->pbCertEncoded);
      X509* x (d2i_X509 (nullptr, &d, static_cast<long> (p->cbCertEncoded)));

      // Skip what OpenSSL cannot parse or already has.
      //
      if (x == nullptr || X509_STORE_add_cert (xs, x) != 1)
        ERR_clear_error ();

      if (x != nullptr)
        X509_free (x);
    }

    CertCloseStore (s, 0);
#endif
  }
}
