#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <sophon/sophon-options.hxx>

namespace sophon
{
  // Per-chunk fetch state.
  //
  //   queued -> fetching -> verifying -> stored
  //
  // A failed attempt that is retried goes back to fetching. Failing the last
  // attempt (or a fatal error) ends in failed.
  //
  enum class chunk_state
  {
    queued,
    fetching,
    verifying,
    stored,
    failed
  };

  std::ostream&
  operator<< (std::ostream&, chunk_state);

  // Attempt limit and exponential backoff with jitter.
  //
  struct retry_policy
  {
    std::uint8_t max_attempts = 5;
    std::chrono::milliseconds base {500};
    std::chrono::milliseconds cap {30000};
    double jitter = 0.2;

    // Delay before the next attempt after the given number of failed ones
    // (starting from 1). The random value is uniform in [0, 1) and maps to
    // the [-jitter, +jitter] relative range.
    //
    std::chrono::milliseconds
    delay (std::uint32_t failures, double random) const;

    static retry_policy
    from (const options&);
  };

  // CDN base URL with its priority (lower is preferred).
  //
  struct cdn_mirror
  {
    std::string url_prefix;
    std::uint32_t priority = 0;
  };

  // Mirrors ordered by priority.
  //
  // Attempt n of a fetch uses mirror n modulo the mirror count, so the first
  // attempt always goes to the preferred mirror and each failure rotates to
  // the next one, wrapping around.
  //
  class mirror_set
  {
  public:
    mirror_set () = default;

    // Throw std::invalid_argument if the list is empty.
    //
    explicit
    mirror_set (std::vector<cdn_mirror>);

    std::size_t
    size () const noexcept
    {
      return mirrors_.size ();
    }

    bool
    empty () const noexcept
    {
      return mirrors_.empty ();
    }

    const cdn_mirror&
    pick (std::size_t attempt) const
    {
      return mirrors_[attempt % mirrors_.size ()];
    }

    // URL of an object under the mirror picked for this attempt.
    //
    std::string
    url (std::size_t attempt,
         const std::string& url_suffix,
         const std::string& name) const
    {
      return pick (attempt).url_prefix + url_suffix + '/' + name;
    }

  private:
    std::vector<cdn_mirror> mirrors_;
  };
}
