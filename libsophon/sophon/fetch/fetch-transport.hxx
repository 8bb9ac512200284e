#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <sophon/sophon-options.hxx>
#include <sophon/http/http-client.hxx>

namespace sophon
{
  // Whole object fetched into memory (manifest blobs).
  //
  struct fetched_blob
  {
    std::string data;
    std::string content_encoding;
  };

  // URL scheme dispatch.
  //
  // http and https go to the Beast client. file URLs read a local mirror
  // directory, with the range emulated by seeking; a missing file is
  // reported like a 404. Anything else is unsupported.
  //
  class transport
  {
  public:
    transport (asio::io_context&, const options&);

    transport (const transport&) = delete;
    transport& operator= (const transport&) = delete;

    asio::awaitable<http_fetch_result>
    fetch (const std::string& url,
           std::uint64_t offset,
           const http_body_sink&,
           std::string accept_encoding = "identity",
           const std::atomic<bool>* cancel = nullptr);

    // Fetch a whole object accepting the compressed encodings manifests are
    // served with.
    //
    asio::awaitable<fetched_blob>
    fetch_all (const std::string& url,
               const std::atomic<bool>* cancel = nullptr);

  private:
    http_fetch_result
    fetch_file (const std::string& path,
                std::uint64_t offset,
                const http_body_sink&,
                const std::atomic<bool>* cancel);

  private:
    http_client http_;
  };

  http_client_traits
  make_client_traits (const options&);
}
