#include <sophon/manifest/manifest-codec.hxx>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include <brotli/decode.h>
#include <miniz.h>

#include <sophon/sophon-error.hxx>

using namespace std;

namespace sophon
{
  blob_encoding
  parse_content_encoding (string_view v)
  {
    // Trim and lower-case.
    //
    string s;
    for (char c: v)
    {
      if (c != ' ' && c != '\t')
        s += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    if (s.empty () || s == "identity") return blob_encoding::identity;
    if (s == "gzip" || s == "x-gzip")  return blob_encoding::gzip;
    if (s == "br" || s == "bz")        return blob_encoding::brotli;
    if (s == "zstd")                   return blob_encoding::zstd;

    throw failure (error::unsupported ("content encoding " + s));
  }

  // Gzip (RFC 1952) members around raw deflate data.
  //
  static string
  gunzip (string_view in)
  {
    enum : uint8_t {ftext = 1, fhcrc = 2, fextra = 4, fname = 8, fcomment = 16};

    auto p (reinterpret_cast<const unsigned char*> (in.data ()));
    size_t n (in.size ()), i (0);
    string r;

    auto need = [&n, &i] (size_t k)
    {
      if (n - i < k)
        throw_malformed ("truncated gzip stream");
    };

    do
    {
      need (10);

      if (p[i] != 0x1f || p[i + 1] != 0x8b || p[i + 2] != 8)
        throw_malformed ("invalid gzip header");

      uint8_t flg (p[i + 3]);
      i += 10;

      if (flg & fextra)
      {
        need (2);
        size_t xlen (p[i] | (p[i + 1] << 8));
        i += 2;
        need (xlen);
        i += xlen;
      }

      for (uint8_t f: {fname, fcomment})
      {
        if (flg & f)
        {
          while (true)
          {
            need (1);
            if (p[i++] == 0)
              break;
          }
        }
      }

      if (flg & fhcrc)
      {
        need (2);
        i += 2;
      }

      // Raw inflate until the end of the deflate stream.
      //
      mz_stream s {};
      if (mz_inflateInit2 (&s, -MZ_DEFAULT_WINDOW_BITS) != MZ_OK)
        throw runtime_error ("unable to initialize inflate");

      size_t start (r.size ());
      unsigned char buf[65536];
      int st;

      s.next_in = p + i;
      s.avail_in = static_cast<unsigned int> (n - i);

      do
      {
        s.next_out = buf;
        s.avail_out = sizeof (buf);

        st = mz_inflate (&s, MZ_NO_FLUSH);

        if (st != MZ_OK && st != MZ_STREAM_END)
        {
          mz_inflateEnd (&s);
          throw_malformed ("corrupt gzip stream");
        }

        r.append (reinterpret_cast<const char*> (buf), sizeof (buf) - s.avail_out);

        if (st == MZ_OK && s.avail_in == 0 && s.avail_out != 0)
        {
          mz_inflateEnd (&s);
          throw_malformed ("truncated gzip stream");
        }
      }
      while (st != MZ_STREAM_END);

      i += s.total_in;
      mz_inflateEnd (&s);

      // Trailer: CRC32 and size modulo 2^32, both little-endian.
      //
      need (8);

      auto le32 = [p] (size_t o)
      {
        return static_cast<uint32_t> (p[o])             |
               static_cast<uint32_t> (p[o + 1]) << 8    |
               static_cast<uint32_t> (p[o + 2]) << 16   |
               static_cast<uint32_t> (p[o + 3]) << 24;
      };

      const unsigned char* d (reinterpret_cast<const unsigned char*> (r.data () + start));
      size_t dn (r.size () - start);

      if (le32 (i) != static_cast<uint32_t> (mz_crc32 (MZ_CRC32_INIT, d, dn)) ||
          le32 (i + 4) != static_cast<uint32_t> (dn))
        throw_malformed ("gzip checksum mismatch");

      i += 8;
    }
    while (i != n); // Concatenated members.

    return r;
  }

  static string
  unbrotli (string_view in)
  {
    BrotliDecoderState* s (BrotliDecoderCreateInstance (nullptr, nullptr, nullptr));
    if (s == nullptr)
      throw runtime_error ("unable to create brotli decoder");

    string r;
    uint8_t buf[65536];

    size_t avail_in (in.size ());
    const uint8_t* next_in (reinterpret_cast<const uint8_t*> (in.data ()));

    BrotliDecoderResult st;
    do
    {
      size_t avail_out (sizeof (buf));
      uint8_t* next_out (buf);

      st = BrotliDecoderDecompressStream (s,
                                          &avail_in, &next_in,
                                          &avail_out, &next_out,
                                          nullptr);

      r.append (reinterpret_cast<const char*> (buf), sizeof (buf) - avail_out);
    }
    while (st == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);

    BrotliDecoderDestroyInstance (s);

    if (st == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
      throw_malformed ("truncated brotli stream");

    if (st != BROTLI_DECODER_RESULT_SUCCESS || avail_in != 0)
      throw_malformed ("corrupt brotli stream");

    return r;
  }

  static string
  unzstd (string_view in)
  {
    zstd_stream_decoder d;
    string r;

    try
    {
      d.decode (in.data (), in.size (),
                [&r] (const char* p, size_t n) {r.append (p, n);});
    }
    catch (const runtime_error& e)
    {
      throw_malformed (string ("corrupt zstd stream: ") + e.what ());
    }

    if (!d.complete ())
      throw_malformed ("truncated zstd stream");

    return r;
  }

  string
  decompress (string_view d, blob_encoding e)
  {
    switch (e)
    {
    case blob_encoding::identity: return string (d);
    case blob_encoding::gzip:     return gunzip (d);
    case blob_encoding::brotli:   return unbrotli (d);
    case blob_encoding::zstd:     return unzstd (d);
    }

    return string (d);
  }

  static bool
  gzip_magic (string_view d)
  {
    return d.size () >= 2 &&
           static_cast<unsigned char> (d[0]) == 0x1f &&
           static_cast<unsigned char> (d[1]) == 0x8b;
  }

  static bool
  zstd_magic (string_view d)
  {
    static const unsigned char m[] = {0x28, 0xb5, 0x2f, 0xfd};
    return d.size () >= 4 && memcmp (d.data (), m, 4) == 0;
  }

  string
  decode_manifest_blob (string_view raw, string_view ce, bool zc)
  {
    blob_encoding e (parse_content_encoding (ce));

    if (e == blob_encoding::identity)
    {
      if (gzip_magic (raw))
        e = blob_encoding::gzip;
      else if (zstd_magic (raw))
        e = blob_encoding::zstd;
    }

    string r (decompress (raw, e));

    if (zc && e != blob_encoding::zstd)
      r = decompress (r, blob_encoding::zstd);

    return r;
  }

  zstd_stream_decoder::
  zstd_stream_decoder ()
    : stream_ (ZSTD_createDStream ())
  {
    if (stream_ == nullptr)
      throw runtime_error ("unable to create zstd stream");

    size_t r (ZSTD_initDStream (stream_));
    if (ZSTD_isError (r))
    {
      ZSTD_freeDStream (stream_);
      throw runtime_error (string ("ZSTD_initDStream failed: ") +
                           ZSTD_getErrorName (r));
    }

    out_.resize (ZSTD_DStreamOutSize ());
  }

  zstd_stream_decoder::
  ~zstd_stream_decoder ()
  {
    ZSTD_freeDStream (stream_);
  }

  void zstd_stream_decoder::
  decode (const void* d, size_t n, const sink& s)
  {
    if (n == 0)
      return;

    ZSTD_inBuffer in {d, n, 0};

    // Keep going while there is input left or the output buffer was filled
    // (more output may be pending inside the decoder).
    //
    for (;;)
    {
      ZSTD_outBuffer out {out_.data (), out_.size (), 0};

      size_t r (ZSTD_decompressStream (stream_, &out, &in));
      if (ZSTD_isError (r))
        throw runtime_error (string ("ZSTD_decompressStream failed: ") +
                             ZSTD_getErrorName (r));

      // Zero means a frame was fully decoded and flushed.
      //
      frame_done_ = (r == 0);

      if (out.pos != 0)
        s (out_.data (), out.pos);

      if (in.pos == in.size && out.pos < out.size)
        break;
    }
  }

  void zstd_stream_decoder::
  reset ()
  {
    ZSTD_DCtx_reset (stream_, ZSTD_reset_session_only);
    frame_done_ = false;
  }
}
