#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <sophon/sophon-error.hxx>
#include <sophon/sophon-options.hxx>
#include <sophon/manifest/manifest-types.hxx>
#include <sophon/store/chunk-store.hxx>
#include <sophon/fetch/fetch-types.hxx>
#include <sophon/fetch/fetch-transport.hxx>
#include <sophon/progress/progress-updater.hxx>

namespace sophon
{
  // Fetcher pool.
  //
  // A fixed number of coroutine workers on the io context drain a FIFO of
  // chunks. Each chunk is downloaded into its .part file in the chunk store
  // (so an interrupted download resumes with a range request), decompressed
  // and hashed on the fly, and stored once the content matches the id.
  //
  // Failed attempts rotate through the mirrors with exponential backoff.
  // Checksum mismatches discard the partial download; network errors keep
  // it. The first terminal failure stops all workers.
  //
  // The queue may be fed from any thread. Callbacks are called on the
  // thread running the io context.
  //
  class fetcher
  {
  public:
    using stored_callback = std::function<void (const chunk_id&)>;
    using failed_callback = std::function<void (const error&)>;

    fetcher (asio::io_context&,
             transport&,
             chunk_store&,
             mirror_set,
             std::string url_suffix,
             const options&,
             progress_updater&,
             std::atomic<bool>& cancel);

    fetcher (const fetcher&) = delete;
    fetcher& operator= (const fetcher&) = delete;

    stored_callback on_stored;
    failed_callback on_failed;

    // Queue a chunk unless it is already queued or in flight.
    //
    void
    enqueue (const chunk&);

    // No more chunks will be queued. Workers exit once the queue is empty.
    //
    void
    close ();

    // Spawn the workers. Run the io context to make them work.
    //
    void
    start ();

    chunk_state
    state (const chunk_id&) const;

    // Fetch and store one chunk with retries. Throw failure on a terminal
    // error.
    //
    asio::awaitable<void>
    fetch (const chunk&);

  private:
    asio::awaitable<void>
    worker ();

    asio::awaitable<void>
    attempt (const chunk&, std::size_t n);

    // Sleep, waking up early on cancellation.
    //
    asio::awaitable<void>
    sleep (std::chrono::milliseconds);

    void
    set_state (const chunk_id&, chunk_state);

    // Account for the first position bytes of the chunk's payload.
    //
    void
    credit (const chunk&, std::uint64_t position);

  private:
    asio::io_context& ioc_;
    transport& net_;
    chunk_store& store_;
    mirror_set mirrors_;
    std::string url_suffix_;
    retry_policy retry_;
    std::uint16_t workers_;
    std::uint8_t verbosity_;
    progress_updater& progress_;
    std::atomic<bool>& cancel_;

    mutable std::mutex mutex_;
    std::deque<chunk> queue_;
    bool closed_ = false;
    bool failed_ = false;
    std::unordered_map<chunk_id, chunk_state> states_;
    std::unordered_map<chunk_id, std::uint64_t> credited_;
    std::unordered_set<chunk_id> stored_;
    std::mt19937 rng_;
  };
}
