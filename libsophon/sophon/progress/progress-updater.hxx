#pragma once

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

#include <sophon/progress/progress-types.hxx>

namespace sophon
{
  // Single aggregation point for run progress.
  //
  // Workers post events from any thread without waiting for anyone. The
  // events are only folded into the totals when a consumer asks for a
  // snapshot, so posting stays cheap even if nobody is watching.
  //
  class progress_updater
  {
  public:
    progress_updater () = default;

    progress_updater (const progress_updater&) = delete;
    progress_updater& operator= (const progress_updater&) = delete;

    void
    post (progress_event);

    // Shortcuts.
    //
    void
    state (progress_state s)
    {
      progress_event e;
      e.state = s;
      post (std::move (e));
    }

    void
    totals (std::uint64_t bytes, std::uint64_t files, std::uint64_t chunks)
    {
      progress_event e;
      e.totals = progress_event::totals_type {bytes, files, chunks};
      post (std::move (e));
    }

    void
    bytes (std::uint64_t n)
    {
      progress_event e;
      e.bytes = n;
      post (std::move (e));
    }

    void
    file_done ()
    {
      progress_event e;
      e.files = 1;
      post (std::move (e));
    }

    void
    chunk_done ()
    {
      progress_event e;
      e.chunks = 1;
      post (std::move (e));
    }

    void
    retry ()
    {
      progress_event e;
      e.retries = 1;
      post (std::move (e));
    }

    void
    broken (std::uint64_t n)
    {
      progress_event e;
      e.broken = n;
      post (std::move (e));
    }

    void
    checks (std::uint64_t total)
    {
      progress_event e;
      e.checks = total;
      post (std::move (e));
    }

    void
    file_checked ()
    {
      progress_event e;
      e.checked = 1;
      post (std::move (e));
    }

    // Work discovered after the totals were set.
    //
    void
    more (std::uint64_t bytes, std::uint64_t chunks)
    {
      progress_event e;
      e.more_bytes = bytes;
      e.more_chunks = chunks;
      post (std::move (e));
    }

    // Transition to failed with a structured reason.
    //
    void
    fail (error);

    // Drain pending events and return the result.
    //
    progress
    snapshot ();

  private:
    void
    apply (progress_event&);

  private:
    std::mutex queue_mutex_;
    std::vector<progress_event> queue_;

    std::mutex state_mutex_;
    progress current_;
  };
}
