#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <sophon/sophon-options.hxx>
#include <sophon/manifest/manifest-types.hxx>
#include <sophon/manifest/manifest-schema.hxx>
#include <sophon/plan/plan-types.hxx>
#include <sophon/store/chunk-store.hxx>
#include <sophon/filesystem/destination.hxx>
#include <sophon/fetch/fetch-types.hxx>
#include <sophon/fetch/fetch-transport.hxx>
#include <sophon/progress/progress-updater.hxx>

namespace sophon
{
  enum class run_mode
  {
    install,
    update,
    repair,
    predownload
  };

  std::ostream&
  operator<< (std::ostream&, run_mode);

  // Where a build comes from: its manifest blob and the CDN carrying its
  // chunks. Normally derived from the vendor build response.
  //
  struct build_source
  {
    std::string id;
    std::string tag;
    std::string build_id;

    std::string manifest_url;

    // MD5 of the manifest blob, empty if unknown.
    //
    std::string manifest_checksum;

    // The blob carries a zstd layer (compression 1 in the manifest download
    // info).
    //
    bool manifest_zstd = false;

    download_info chunk_download;

    std::optional<manifest_stats> stats;

    // Additional chunk CDN prefixes. The prefix of chunk_download takes part
    // with priority 0 unless it is empty.
    //
    std::vector<cdn_mirror> mirrors;

    // Throw failure with malformed_manifest if there is no CDN at all.
    //
    mirror_set
    chunk_mirrors () const;

    static build_source
    from (const build_info&, const build_manifest&);
  };

  // Drives one run.
  //
  // The sequence is: load and validate the manifests, plan against the
  // destination, extract chunks from the old build, rename, fetch and
  // assemble concurrently, delete, and finally remove .staging/ (and unless
  // asked to keep it, .chunks/). A run that fails or is cancelled leaves both
  // directories in place so the next run resumes from them.
  //
  class coordinator
  {
  public:
    coordinator (run_mode,
                 build_source target,
                 std::optional<build_source> previous,
                 std::filesystem::path root,
                 options,
                 progress_updater&,
                 std::atomic<bool>& cancel);

    coordinator (const coordinator&) = delete;
    coordinator& operator= (const coordinator&) = delete;

    // Execute the run on the calling thread. Throw failure.
    //
    void
    run ();

    const manifest&
    target () const noexcept
    {
      return target_;
    }

    const plan&
    current_plan () const noexcept
    {
      return plan_;
    }

  private:
    manifest
    load (const build_source&);

    asio::awaitable<fetched_blob>
    download (const std::string& url);

    // Return false if the chunk has to be fetched after all.
    //
    bool
    extract (destination&, chunk_store&, const plan_step&);

    void
    execute (destination&, chunk_store&, const std::vector<chunk_id>& extra);

    void
    check_cancel () const;

  private:
    run_mode mode_;
    build_source target_src_;
    std::optional<build_source> previous_src_;
    std::filesystem::path root_;
    options opts_;
    progress_updater& progress_;
    std::atomic<bool>& cancel_;

    asio::io_context ioc_;
    transport net_;

    manifest target_;
    std::optional<manifest> previous_;
    plan plan_;
  };
}
