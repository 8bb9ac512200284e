#include <openssl/ssl.h>

namespace sophon
{
  template <typename T>
  inline void basic_http_client<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl ? ssl::verify_peer
                                                 : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<http_fetch_result> basic_http_client<T>::
  fetch (const std::string& url,
         std::uint64_t offset,
         const http_body_sink& sink,
         std::string accept_encoding,
         const std::atomic<bool>* cancel)
  {
    co_return co_await fetch_impl (url, offset, sink, accept_encoding, cancel, 0);
  }
}
