#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <sophon/sophon-error.hxx>

namespace sophon
{
  // Run state.
  //
  // Done and failed are terminal: once either is reached no further state
  // change is accepted.
  //
  enum class progress_state
  {
    planning,
    downloading,
    assembling,
    verifying,
    done,
    failed
  };

  std::ostream&
  operator<< (std::ostream&, progress_state);

  // Snapshot of a run's progress.
  //
  // The done counters never decrease, failure included. Bytes are payload
  // bytes as transferred from the CDN, files are assemblies and chunks are
  // fetched chunks; each total is what the plan called for.
  //
  struct progress
  {
    std::uint64_t total_bytes = 0;
    std::uint64_t done_bytes = 0;

    std::uint64_t total_files = 0;
    std::uint64_t done_files = 0;

    std::uint64_t total_chunks = 0;
    std::uint64_t done_chunks = 0;

    // Fetch attempts and file re-assemblies that had to be repeated.
    //
    std::uint64_t retries = 0;

    // Files found missing or damaged during planning.
    //
    std::uint64_t broken_files = 0;

    // Installed files checked against the manifest so far while planning
    // (hashed when verifying), out of total_checks.
    //
    std::uint64_t total_checks = 0;
    std::uint64_t checked_files = 0;

    progress_state state = progress_state::planning;

    // Set when state is failed.
    //
    std::optional<error> reason;

    bool
    finished () const noexcept
    {
      return state == progress_state::done || state == progress_state::failed;
    }
  };

  // Progress change posted by a worker.
  //
  // Deltas are added to the done counters. A set of totals replaces the
  // current ones while the more_* deltas grow them.
  //
  struct progress_event
  {
    std::optional<progress_state> state;

    std::uint64_t bytes = 0;
    std::uint64_t files = 0;
    std::uint64_t chunks = 0;
    std::uint64_t retries = 0;
    std::uint64_t broken = 0;
    std::uint64_t checked = 0;

    std::uint64_t more_bytes = 0;
    std::uint64_t more_chunks = 0;

    std::optional<std::uint64_t> checks;

    struct totals_type
    {
      std::uint64_t bytes;
      std::uint64_t files;
      std::uint64_t chunks;
    };

    std::optional<totals_type> totals;

    std::optional<error> reason;
  };
}
