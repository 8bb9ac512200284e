#include <limits>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <sophon/sophon-error.hxx>

namespace sophon
{
  template <typename T>
  asio::awaitable<http_fetch_result> basic_http_client<T>::
  fetch_impl (const std::string& url,
              std::uint64_t offset,
              const http_body_sink& sink,
              const std::string& accept_encoding,
              const std::atomic<bool>* cancel,
              std::uint8_t redirects)
  {
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    using tcp = asio::ip::tcp;
    using parser_type = http::response_parser<http::buffer_body>;

    if (redirects > traits_.max_redirects)
      throw failure (error::network (false, "too many redirects for " + url));

    url_parts parts;
    try
    {
      parts = parse_url (url);
    }
    catch (const std::invalid_argument& e)
    {
      throw failure (error::network (false, e.what ()));
    }

    bool tls (parts.scheme == "https");

    if (!tls && parts.scheme != "http")
      throw failure (error::unsupported ("URL scheme " + parts.scheme));

    http_fetch_result r;
    std::optional<std::string> location;

    // Common exchange for both TLS and plain streams.
    //
    auto transfer = [&] (auto& s) -> asio::awaitable<void>
    {
      auto& layer (beast::get_lowest_layer (s));

      // One deadline for the whole exchange.
      //
      auto deadline (std::chrono::steady_clock::now () +
                     traits_.request_timeout);

      http::request<http::empty_body> rq;
      rq.method (http::verb::get);
      rq.target (parts.target);
      rq.version (11);
      rq.set (http::field::host, parts.host);
      rq.set (http::field::user_agent, traits_.user_agent);
      rq.set (http::field::accept_encoding, accept_encoding);
      rq.set (http::field::connection, "close");

      if (offset != 0)
        rq.set (http::field::range, range_header (offset));

      layer.expires_at (deadline);
      co_await http::async_write (s, rq, asio::use_awaitable);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      r.status = p.get ().result_int ();

      switch (classify_status (r.status))
      {
      case status_class::success:
        break;
      case status_class::redirect:
        {
          auto l (p.get ()[http::field::location]);

          if (l.empty ())
            throw failure (error::network (false,
                                           "redirect without location",
                                           static_cast<std::uint16_t> (r.status)));

          location = std::string (l);
          co_return;
        }
      case status_class::retriable:
      case status_class::fatal:
        {
          throw failure (
            error::network (classify_status (r.status) ==
                              status_class::retriable,
                            "GET " + url,
                            static_cast<std::uint16_t> (r.status)));
        }
      }

      // Note that a server is free to ignore the range and send the whole
      // thing with 200.
      //
      r.resumed = offset != 0 && r.status == 206;
      r.content_encoding = std::string (p.get ()[http::field::content_encoding]);

      if (sink.begin)
        sink.begin (r.resumed, r.content_encoding);

      char buf[65536];

      while (!p.is_done ())
      {
        if (cancel != nullptr && cancel->load ())
          throw_cancelled ();

        p.get ().body ().data = buf;
        p.get ().body ().size = sizeof (buf);

        layer.expires_at (deadline);

        beast::error_code ec;
        co_await http::async_read_some (
          s, b, p, asio::redirect_error (asio::use_awaitable, ec));

        // need_buffer only means our buffer is full.
        //
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t n (sizeof (buf) - p.get ().body ().size);

        if (n != 0)
        {
          sink.data (buf, n);
          r.bytes += n;
        }
      }
    };

    try
    {
      tcp::resolver rslv (ioc_);
      auto addrs (co_await rslv.async_resolve (parts.host,
                                               parts.port,
                                               asio::use_awaitable));

      if (tls)
      {
        beast::ssl_stream<beast::tcp_stream> s (ioc_, ssl_ctx_);

        // Many servers (e.g., behind CDNs) reject a handshake without SNI.
        // Beast doesn't wrap this so we drop down to the OpenSSL API.
        //
        if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
        {
          beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                                asio::error::get_ssl_category ());
          throw beast::system_error (ec, "unable to set SNI hostname");
        }

        auto& layer (beast::get_lowest_layer (s));
        layer.expires_after (traits_.connect_timeout);

        co_await layer.async_connect (addrs, asio::use_awaitable);
        co_await s.async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);

        co_await transfer (s);

        // Many servers don't send close_notify and waiting for it can block
        // until the timeout, so just drop the connection.
        //
        beast::error_code ec;
        layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }
      else
      {
        beast::tcp_stream s (ioc_);
        s.expires_after (traits_.connect_timeout);
        co_await s.async_connect (addrs, asio::use_awaitable);

        co_await transfer (s);

        beast::error_code ec;
        s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }
    }
    catch (const boost::system::system_error& e)
    {
      // Resolution, connection, TLS and timeout errors are all worth
      // another attempt.
      //
      throw failure (error::network (true,
                                     "GET " + url + ": " + e.code ().message (),
                                     0,
                                     std::error_code (e.code ())));
    }

    if (location)
      co_return co_await fetch_impl (resolve_location (url, *location),
                                     offset,
                                     sink,
                                     accept_encoding,
                                     cancel,
                                     redirects + 1);

    co_return r;
  }
}
