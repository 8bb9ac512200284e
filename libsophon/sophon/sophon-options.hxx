#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/json/value.hpp>

#include <sophon/version.hxx>

namespace sophon
{
  // Run configuration.
  //
  // A default-constructed options object is valid. Everything is passed
  // explicitly to the run that uses it; there is no process-wide state.
  //
  struct options
  {
    // Fetcher pool size.
    //
    std::uint16_t downloader_threads = 8;

    // Assembler pool size. Zero means max (2, downloader_threads / 2).
    //
    std::uint16_t assembler_threads = 0;

    // Attempts per chunk (and per file re-assembly) before the run fails.
    //
    std::uint8_t max_retries = 5;

    std::chrono::milliseconds connect_timeout {30000};
    std::chrono::milliseconds request_timeout {120000};

    // Exponential backoff between attempts: base * 2^(n-1), capped, with
    // a relative jitter of +/- backoff_jitter.
    //
    std::chrono::milliseconds backoff_base {500};
    std::chrono::milliseconds backoff_cap {30000};
    double backoff_jitter = 0.2;

    // Hash files already present at the destination before skipping them.
    // If false, a file with the expected size is trusted.
    //
    bool verify_existing = true;

    // Keep .chunks/ after a successful run.
    //
    bool keep_chunk_cache = false;

    bool check_free_space = true;

    std::uint8_t max_redirects = 10;

    std::string user_agent = "sophon/" SOPHON_VERSION_STR;

    // 0 - silent, 1 - errors and warnings, 2 - info, 3 - trace.
    //
    std::uint8_t verbosity = 1;

    std::uint16_t
    assemblers () const noexcept
    {
      if (assembler_threads != 0)
        return assembler_threads;

      std::uint16_t n (downloader_threads / 2);
      return n < 2 ? 2 : n;
    }

    // Throw std::invalid_argument if the combination is unusable.
    //
    void
    validate () const;
  };

  // Load options from a JSON object with the same member names. Durations
  // are integer milliseconds. Unknown members are rejected with
  // std::invalid_argument, as are values of the wrong type or range.
  //
  options
  parse_options (const boost::json::value&);

  options
  parse_options (const std::string& json_text);
}
