#include <sophon/manifest/manifest-codec.hxx>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <string>

#include <brotli/encode.h>
#include <miniz.h>
#include <zstd.h>

#include <sophon/sophon-error.hxx>

using namespace std;
using namespace sophon;

static string
sample ()
{
  string r;
  for (int i (0); i != 5000; ++i)
    r += "asset " + to_string (i % 97) + ";";
  return r;
}

// Wrap raw deflate output into a single gzip member.
//
static string
gzip (const string& s)
{
  mz_ulong n (mz_compressBound (static_cast<mz_ulong> (s.size ())) + 64);
  string body (n, '\0');

  mz_stream z {};
  assert (mz_deflateInit2 (&z,
                           MZ_DEFAULT_LEVEL,
                           MZ_DEFLATED,
                           -MZ_DEFAULT_WINDOW_BITS,
                           9,
                           MZ_DEFAULT_STRATEGY) == MZ_OK);

  z.next_in = reinterpret_cast<const unsigned char*> (s.data ());
  z.avail_in = static_cast<unsigned int> (s.size ());
  z.next_out = reinterpret_cast<unsigned char*> (&body[0]);
  z.avail_out = static_cast<unsigned int> (body.size ());

  assert (mz_deflate (&z, MZ_FINISH) == MZ_STREAM_END);
  body.resize (z.total_out);
  mz_deflateEnd (&z);

  string r ("\x1f\x8b\x08\x00\x00\x00\x00\x00\x00\x03", 10);
  r += body;

  auto le32 = [&r] (uint32_t v)
  {
    for (int i (0); i != 4; ++i)
      r += static_cast<char> ((v >> (8 * i)) & 0xff);
  };

  le32 (static_cast<uint32_t> (
          mz_crc32 (MZ_CRC32_INIT,
                    reinterpret_cast<const unsigned char*> (s.data ()),
                    s.size ())));
  le32 (static_cast<uint32_t> (s.size ()));
  return r;
}

static string
brotli (const string& s)
{
  size_t n (BrotliEncoderMaxCompressedSize (s.size ()));
  string r (n, '\0');

  assert (BrotliEncoderCompress (BROTLI_DEFAULT_QUALITY,
                                 BROTLI_DEFAULT_WINDOW,
                                 BROTLI_MODE_GENERIC,
                                 s.size (),
                                 reinterpret_cast<const uint8_t*> (s.data ()),
                                 &n,
                                 reinterpret_cast<uint8_t*> (&r[0])));
  r.resize (n);
  return r;
}

static string
zstd (const string& s)
{
  string r (ZSTD_compressBound (s.size ()), '\0');
  size_t n (ZSTD_compress (&r[0], r.size (), s.data (), s.size (), 3));
  assert (!ZSTD_isError (n));
  r.resize (n);
  return r;
}

static error_kind
decode_error (const string& raw, const string& ce, bool zc = false)
{
  try
  {
    decode_manifest_blob (raw, ce, zc);
  }
  catch (const failure& e)
  {
    return e.reason ().kind;
  }

  assert (false);
  return error_kind::filesystem;
}

static void
test_encodings ()
{
  assert (parse_content_encoding ("") == blob_encoding::identity);
  assert (parse_content_encoding ("GZIP") == blob_encoding::gzip);
  assert (parse_content_encoding ("br") == blob_encoding::brotli);
  assert (parse_content_encoding ("bz") == blob_encoding::brotli);
  assert (parse_content_encoding (" zstd ") == blob_encoding::zstd);

  assert (decode_error ("x", "compress") == error_kind::unsupported);
}

static void
test_blobs ()
{
  const string s (sample ());

  assert (decode_manifest_blob (s, "", false) == s);
  assert (decode_manifest_blob (gzip (s), "gzip", false) == s);
  assert (decode_manifest_blob (brotli (s), "br", false) == s);
  assert (decode_manifest_blob (zstd (s), "", true) == s);

  // Without headers the gzip and zstd magic is recognized.
  //
  assert (decode_manifest_blob (gzip (s), "", false) == s);
  assert (decode_manifest_blob (zstd (s), "", false) == s);

  // Transport encoding over a zstd payload.
  //
  assert (decode_manifest_blob (gzip (zstd (s)), "gzip", true) == s);

  // Concatenated gzip members.
  //
  assert (decode_manifest_blob (gzip ("abc") + gzip ("def"), "gzip", false) ==
          "abcdef");
}

static void
test_corrupt ()
{
  const string s (sample ());

  string g (gzip (s));
  assert (decode_error (g.substr (0, g.size () / 2), "gzip") ==
          error_kind::malformed_manifest);

  g[g.size () - 6] ^= 0x55; // CRC.
  assert (decode_error (g, "gzip") == error_kind::malformed_manifest);

  string b (brotli (s));
  assert (decode_error (b.substr (0, b.size () / 2), "br") ==
          error_kind::malformed_manifest);

  string z (zstd (s));
  assert (decode_error (z.substr (0, z.size () - 4), "", true) ==
          error_kind::malformed_manifest);
}

// Output is produced regardless of how the input is split.
//
static void
test_stream ()
{
  const string s (sample ());
  const string z (zstd (s));

  zstd_stream_decoder d;
  string r;
  auto sink = [&r] (const char* p, size_t n) {r.append (p, n);};

  for (size_t i (0); i < z.size (); i += 7)
  {
    assert (!d.complete ());
    d.decode (z.data () + i, min<size_t> (7, z.size () - i), sink);
  }

  assert (d.complete ());
  assert (r == s);

  // Garbage is rejected, and reset allows reuse.
  //
  bool thrown (false);
  try
  {
    d.reset ();
    d.decode ("garbage!", 8, sink);
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);

  d.reset ();
  r.clear ();
  d.decode (z.data (), z.size (), sink);
  assert (d.complete () && r == s);
}

int
main ()
{
  test_encodings ();
  test_blobs ();
  test_corrupt ();
  test_stream ();
}
