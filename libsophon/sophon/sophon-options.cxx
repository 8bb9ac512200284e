#include <sophon/sophon-options.hxx>

#include <limits>
#include <stdexcept>

#include <boost/json/parse.hpp>

using namespace std;

namespace sophon
{
  namespace json = boost::json;

  void options::
  validate () const
  {
    if (downloader_threads == 0)
      throw invalid_argument ("downloader_threads must be positive");

    if (max_retries == 0)
      throw invalid_argument ("max_retries must be positive");

    if (backoff_jitter < 0.0 || backoff_jitter >= 1.0)
      throw invalid_argument ("backoff_jitter must be in [0, 1)");

    if (backoff_cap < backoff_base)
      throw invalid_argument ("backoff_cap must not be less than backoff_base");

    if (request_timeout.count () <= 0 || connect_timeout.count () <= 0)
      throw invalid_argument ("timeouts must be positive");
  }

  // Extract an unsigned integer member that fits into T.
  //
  template <typename T>
  static T
  unsigned_member (const json::value& v, const char* n)
  {
    uint64_t r;

    if (v.is_uint64 ())
      r = v.as_uint64 ();
    else if (v.is_int64 () && v.as_int64 () >= 0)
      r = static_cast<uint64_t> (v.as_int64 ());
    else
      throw invalid_argument (string ("option ") + n +
                              " must be a non-negative integer");

    if (r > numeric_limits<T>::max ())
      throw invalid_argument (string ("option ") + n + " is out of range");

    return static_cast<T> (r);
  }

  static bool
  bool_member (const json::value& v, const char* n)
  {
    if (!v.is_bool ())
      throw invalid_argument (string ("option ") + n + " must be a boolean");

    return v.as_bool ();
  }

  static chrono::milliseconds
  duration_member (const json::value& v, const char* n)
  {
    return chrono::milliseconds (unsigned_member<uint32_t> (v, n));
  }

  options
  parse_options (const json::value& jv)
  {
    if (!jv.is_object ())
      throw invalid_argument ("options must be a JSON object");

    options r;

    for (const auto& m: jv.as_object ())
    {
      const string k (m.key ());
      const json::value& v (m.value ());
      const char* n (k.c_str ());

      if      (k == "downloader_threads") r.downloader_threads = unsigned_member<uint16_t> (v, n);
      else if (k == "assembler_threads")  r.assembler_threads  = unsigned_member<uint16_t> (v, n);
      else if (k == "max_retries")        r.max_retries        = unsigned_member<uint8_t> (v, n);
      else if (k == "max_redirects")      r.max_redirects      = unsigned_member<uint8_t> (v, n);
      else if (k == "verbosity")          r.verbosity          = unsigned_member<uint8_t> (v, n);
      else if (k == "connect_timeout")    r.connect_timeout    = duration_member (v, n);
      else if (k == "request_timeout")    r.request_timeout    = duration_member (v, n);
      else if (k == "backoff_base")       r.backoff_base       = duration_member (v, n);
      else if (k == "backoff_cap")        r.backoff_cap        = duration_member (v, n);
      else if (k == "verify_existing")    r.verify_existing    = bool_member (v, n);
      else if (k == "keep_chunk_cache")   r.keep_chunk_cache   = bool_member (v, n);
      else if (k == "check_free_space")   r.check_free_space   = bool_member (v, n);
      else if (k == "backoff_jitter")
      {
        if (!v.is_number ())
          throw invalid_argument ("option backoff_jitter must be a number");

        r.backoff_jitter = v.to_number<double> ();
      }
      else if (k == "user_agent")
      {
        if (!v.is_string ())
          throw invalid_argument ("option user_agent must be a string");

        r.user_agent = string (v.as_string ());
      }
      else
        throw invalid_argument ("unknown option " + k);
    }

    r.validate ();
    return r;
  }

  options
  parse_options (const string& s)
  {
    boost::system::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
      throw invalid_argument ("invalid options JSON: " + ec.message ());

    return parse_options (jv);
  }
}
