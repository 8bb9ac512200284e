#include <sophon/manifest/manifest-schema.hxx>

#include <charconv>
#include <limits>

#include <boost/json/parse.hpp>

#include <sophon/sophon-error.hxx>

using namespace std;

namespace sophon
{
  namespace json = boost::json;

  const build_manifest* build_info::
  find (const string& f) const
  {
    for (const build_manifest& m: manifests)
    {
      if (m.matching_field == f)
        return &m;
    }

    return nullptr;
  }

  static const json::object&
  object (const json::value& v, const char* what)
  {
    if (!v.is_object ())
      throw_malformed (string (what) + " must be an object");

    return v.as_object ();
  }

  static const json::value&
  member (const json::object& o, const char* n)
  {
    auto i (o.find (n));

    if (i == o.end ())
      throw_malformed (string ("missing member ") + n);

    return i->value ();
  }

  static string
  text (const json::object& o, const char* n, bool required = true)
  {
    auto i (o.find (n));

    if (i == o.end ())
    {
      if (required)
        throw_malformed (string ("missing member ") + n);

      return string ();
    }

    if (!i->value ().is_string ())
      throw_malformed (string ("member ") + n + " must be a string");

    return string (i->value ().as_string ());
  }

  // The vendor encodes most counters as decimal strings but we also accept
  // plain numbers.
  //
  static uint64_t
  number (const json::object& o, const char* n)
  {
    const json::value& v (member (o, n));

    if (v.is_uint64 ())
      return v.as_uint64 ();

    if (v.is_int64 () && v.as_int64 () >= 0)
      return static_cast<uint64_t> (v.as_int64 ());

    if (v.is_string ())
    {
      const json::string& s (v.as_string ());
      uint64_t r (0);

      auto [p, ec] = from_chars (s.data (), s.data () + s.size (), r);

      if (ec == errc () && p == s.data () + s.size () && !s.empty ())
        return r;
    }

    throw_malformed (string ("member ") + n +
                     " must be a non-negative integer");
  }

  static uint8_t
  small_number (const json::object& o, const char* n)
  {
    uint64_t r (number (o, n));

    if (r > numeric_limits<uint8_t>::max ())
      throw_malformed (string ("member ") + n + " is out of range");

    return static_cast<uint8_t> (r);
  }

  download_info
  parse_download_info (const json::value& jv)
  {
    const json::object& o (object (jv, "download info"));

    download_info r;
    r.encryption = small_number (o, "encryption");
    r.password = text (o, "password", false);
    r.compression = small_number (o, "compression");
    r.url_prefix = text (o, "url_prefix");
    r.url_suffix = text (o, "url_suffix", false);

    if (r.url_prefix.empty ())
      throw_malformed ("empty url_prefix");

    return r;
  }

  manifest_stats
  parse_manifest_stats (const json::value& jv)
  {
    const json::object& o (object (jv, "manifest stats"));

    manifest_stats r;
    r.compressed_size = number (o, "compressed_size");
    r.uncompressed_size = number (o, "uncompressed_size");
    r.file_count = number (o, "file_count");
    r.chunk_count = number (o, "chunk_count");
    return r;
  }

  static manifest_blob
  parse_manifest_blob (const json::value& jv)
  {
    const json::object& o (object (jv, "manifest"));

    manifest_blob r;
    r.id = text (o, "id");
    r.checksum = text (o, "checksum", false);

    if (r.id.empty ())
      throw_malformed ("empty manifest id");

    if (o.contains ("compressed_size"))
      r.compressed_size = number (o, "compressed_size");

    if (o.contains ("uncompressed_size"))
      r.uncompressed_size = number (o, "uncompressed_size");

    return r;
  }

  static build_manifest
  parse_build_manifest (const json::value& jv)
  {
    const json::object& o (object (jv, "build manifest"));

    build_manifest r;
    r.category_id = text (o, "category_id", false);
    r.category_name = text (o, "category_name", false);
    r.matching_field = text (o, "matching_field", false);
    r.manifest = parse_manifest_blob (member (o, "manifest"));
    r.chunk_download = parse_download_info (member (o, "chunk_download"));
    r.manifest_download = parse_download_info (member (o, "manifest_download"));

    auto stats = [&o] (const char* n) -> optional<manifest_stats>
    {
      auto i (o.find (n));

      if (i == o.end () || i->value ().is_null ())
        return nullopt;

      return parse_manifest_stats (i->value ());
    };

    r.stats = stats ("stats");
    r.deduplicated_stats = stats ("deduplicated_stats");
    return r;
  }

  build_info
  parse_build_info (const json::value& jv)
  {
    const json::object* o (&object (jv, "response"));

    // Unwrap the API envelope.
    //
    if (o->contains ("retcode"))
    {
      const json::value& rc (o->at ("retcode"));

      if (!rc.is_int64 () && !rc.is_uint64 ())
        throw_malformed ("retcode must be an integer");

      if (rc.to_number<int64_t> () != 0)
      {
        string m (text (*o, "message", false));
        throw_malformed ("vendor API error " +
                         std::to_string (rc.to_number<int64_t> ()) +
                         (m.empty () ? string () : ": " + m));
      }

      o = &object (member (*o, "data"), "data");
    }

    build_info r;
    r.build_id = text (*o, "build_id");
    r.tag = text (*o, "tag", false);

    const json::value& ms (member (*o, "manifests"));
    if (!ms.is_array ())
      throw_malformed ("manifests must be an array");

    for (const json::value& m: ms.as_array ())
      r.manifests.push_back (parse_build_manifest (m));

    return r;
  }

  build_info
  parse_build_info (const string& s)
  {
    boost::system::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
      throw_malformed ("invalid JSON: " + ec.message ());

    return parse_build_info (jv);
  }
}
