#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <zstd.h>

namespace sophon
{
  // Transfer encoding of a manifest blob.
  //
  enum class blob_encoding
  {
    identity,
    gzip,
    brotli,
    zstd
  };

  inline std::ostream&
  operator<< (std::ostream& os, blob_encoding e)
  {
    switch (e)
    {
      case blob_encoding::identity: return os << "identity";
      case blob_encoding::gzip:     return os << "gzip";
      case blob_encoding::brotli:   return os << "br";
      case blob_encoding::zstd:     return os << "zstd";
    }
    return os;
  }

  // Map a Content-Encoding header value. Both "br" and the vendor's "bz"
  // spelling mean brotli. An empty value means identity. Throw failure with
  // unsupported for anything else.
  //
  blob_encoding
  parse_content_encoding (std::string_view);

  // Undo one layer of encoding. Throw failure with malformed_manifest if the
  // data is corrupt or truncated.
  //
  std::string
  decompress (std::string_view data, blob_encoding);

  // Turn a fetched manifest blob into the record stream.
  //
  // First the transport encoding named by content_encoding is removed. If it
  // is empty the gzip and zstd magic numbers are sniffed instead (local
  // mirrors carry no headers). Then, if the download info says so
  // (compression == 1), a zstd layer is removed unless the sniffing already
  // did.
  //
  std::string
  decode_manifest_blob (std::string_view raw,
                        std::string_view content_encoding,
                        bool zstd_compressed);

  // Streaming zstd decoder for chunk payloads.
  //
  class zstd_stream_decoder
  {
  public:
    using sink = std::function<void (const char*, std::size_t)>;

    zstd_stream_decoder ();
    ~zstd_stream_decoder ();

    zstd_stream_decoder (const zstd_stream_decoder&) = delete;
    zstd_stream_decoder& operator= (const zstd_stream_decoder&) = delete;

    // Feed compressed input, passing decompressed output to the sink. Throw
    // std::runtime_error if the input is corrupt.
    //
    void
    decode (const void* data, std::size_t size, const sink&);

    // Return true if the input fed so far ends on a frame boundary.
    //
    bool
    complete () const noexcept
    {
      return frame_done_;
    }

    // Start over (e.g., when a download restarts from scratch).
    //
    void
    reset ();

  private:
    ZSTD_DStream* stream_;
    bool frame_done_ = false;
    std::string out_;
  };
}
