#include <sophon/fetch/fetch-types.hxx>

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

namespace sophon
{
  ostream&
  operator<< (ostream& os, chunk_state s)
  {
    switch (s)
    {
      case chunk_state::queued:    return os << "queued";
      case chunk_state::fetching:  return os << "fetching";
      case chunk_state::verifying: return os << "verifying";
      case chunk_state::stored:    return os << "stored";
      case chunk_state::failed:    return os << "failed";
    }
    return os;
  }

  chrono::milliseconds retry_policy::
  delay (uint32_t n, double r) const
  {
    if (n == 0)
      return chrono::milliseconds (0);

    // Double from the base, without overflowing on large attempt counts.
    //
    double d (static_cast<double> (base.count ()));
    double c (static_cast<double> (cap.count ()));

    for (uint32_t i (1); i < n && d < c; ++i)
      d *= 2;

    d = min (d, c);
    d *= 1.0 + jitter * (2.0 * r - 1.0);

    return chrono::milliseconds (
      static_cast<chrono::milliseconds::rep> (max (0.0, round (d))));
  }

  retry_policy retry_policy::
  from (const options& o)
  {
    retry_policy r;
    r.max_attempts = o.max_retries;
    r.base = o.backoff_base;
    r.cap = o.backoff_cap;
    r.jitter = o.backoff_jitter;
    return r;
  }

  mirror_set::
  mirror_set (vector<cdn_mirror> ms)
    : mirrors_ (move (ms))
  {
    if (mirrors_.empty ())
      throw invalid_argument ("no CDN mirrors");

    stable_sort (mirrors_.begin (), mirrors_.end (),
                 [] (const cdn_mirror& x, const cdn_mirror& y)
                 {
                   return x.priority < y.priority;
                 });
  }
}
