#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <sophon/http/http-types.hxx>

namespace sophon
{
  namespace asio = boost::asio;
  namespace ssl  = boost::asio::ssl;

  // HTTP client configuration traits.
  //
  struct http_client_traits
  {
    std::chrono::milliseconds connect_timeout {30000};

    // Deadline for the whole exchange, from sending the request to the last
    // body byte.
    //
    std::chrono::milliseconds request_timeout {120000};

    std::uint8_t max_redirects = 10;

    bool verify_ssl = true;

    // Certificate bundle (empty means use the system default paths).
    //
    std::string ssl_cert_file;

    std::string user_agent = "sophon";
  };

  // Response body streaming interface.
  //
  // begin() is called once the final (non-redirect) response header is in,
  // with whether the server honoured the range request and the value of
  // Content-Encoding. data() is then called for each piece of the body.
  //
  struct http_body_sink
  {
    std::function<void (bool resumed, const std::string& encoding)> begin;
    std::function<void (const char*, std::size_t)> data;
  };

  struct http_fetch_result
  {
    unsigned status = 0;
    bool resumed = false;
    std::string content_encoding;
    std::uint64_t bytes = 0; // Body bytes received.
  };

  // Streaming GET client over Boost.Beast.
  //
  // Each fetch uses its own connection. Non-success statuses and transport
  // errors are reported as failure with the network kind, retriable or not
  // according to classify_status().
  //
  template <typename T = http_client_traits>
  class basic_http_client
  {
  public:
    using traits_type = T;

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    // GET the URL streaming the body into the sink. If offset is not zero
    // request the remainder with a Range header; the server may ignore it
    // in which case begin() is told the body starts from scratch.
    //
    // The cancel flag, if any, is checked between body reads. The URL and
    // sink must outlive the returned awaitable.
    //
    asio::awaitable<http_fetch_result>
    fetch (const std::string& url,
           std::uint64_t offset,
           const http_body_sink&,
           std::string accept_encoding = "identity",
           const std::atomic<bool>* cancel = nullptr);

  private:
    void
    configure_ssl ();

    asio::awaitable<http_fetch_result>
    fetch_impl (const std::string& url,
                std::uint64_t offset,
                const http_body_sink&,
                const std::string& accept_encoding,
                const std::atomic<bool>* cancel,
                std::uint8_t redirects);

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  using http_client = basic_http_client<>;
}

#include <sophon/http/http-client.ixx>
#include <sophon/http/http-client.txx>
