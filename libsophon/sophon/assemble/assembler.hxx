#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <sophon/sophon-error.hxx>
#include <sophon/sophon-options.hxx>
#include <sophon/manifest/manifest-types.hxx>
#include <sophon/store/chunk-store.hxx>
#include <sophon/filesystem/destination.hxx>
#include <sophon/progress/progress-updater.hxx>

namespace sophon
{
  namespace asio = boost::asio;

  // Assembler pool.
  //
  // Materializes files from stored chunks. Each file is written to
  // .staging/<uuid>, synced, checked against its size and MD5, and only then
  // moved to its final path, after which one reference to each of its chunks
  // is released.
  //
  // Callbacks are called from the pool threads.
  //
  class assembler
  {
  public:
    using done_callback = std::function<void (const file_entry&)>;

    // The file could not be assembled because these chunks are missing or
    // damaged. Damaged ones have been evicted from the store.
    //
    using refetch_callback =
      std::function<void (const file_entry&, std::vector<chunk_id>)>;

    using failed_callback = std::function<void (const error&)>;

    assembler (destination&,
               chunk_store&,
               const options&,
               progress_updater&,
               std::atomic<bool>& cancel);

    // Wait for the queued work.
    //
    ~assembler ();

    assembler (const assembler&) = delete;
    assembler& operator= (const assembler&) = delete;

    done_callback on_done;
    refetch_callback on_refetch;
    failed_callback on_failed;

    // Queue a file. The entry must stay alive until the callback for it.
    //
    void
    submit (const file_entry&);

    void
    join ();

    // Assemble a file on the calling thread. Return the missing or damaged
    // chunks if there are any, in which case nothing is installed.
    //
    // Throw failure with checksum_mismatch (file scope) if the chunks are
    // all sound but do not add up to the file, cancelled if the run is
    // cancelled between chunks, or filesystem on I/O errors. The staging
    // file never outlives a failed call.
    //
    std::vector<chunk_id>
    assemble (const file_entry&);

  private:
    destination& dest_;
    chunk_store& store_;
    std::uint8_t verbosity_;
    progress_updater& progress_;
    std::atomic<bool>& cancel_;
    asio::thread_pool pool_;
  };
}
