#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sophon/sophon-error.hxx>
#include <sophon/sophon-options.hxx>
#include <sophon/manifest/manifest-types.hxx>
#include <sophon/filesystem/destination.hxx>
#include <sophon/progress/progress-types.hxx>
#include <sophon/coordinator/coordinator.hxx>

namespace sophon
{
  struct install_result
  {
    bool success = false;

    // Set unless successful.
    //
    std::optional<error> reason;
  };

  // Handle of a run executing on its own thread.
  //
  // Destroying a handle whose run has not finished cancels the run and
  // waits for it to wind down.
  //
  class updater
  {
  public:
    updater (updater&&) noexcept;
    updater& operator= (updater&&) noexcept;

    ~updater ();

    // Never blocks on the run.
    //
    progress
    snapshot ();

    // Ask the run to stop. Fetches stop at the next chunk boundary (or body
    // read) and assemblies between chunks. Files already at their final
    // paths stay, nothing partial ever reaches a final path.
    //
    void
    cancel ();

    // Wait for the run to finish. May be called more than once.
    //
    // All three throw std::logic_error on a moved-from handle.
    //
    install_result
    wait ();

  public:
    struct state;

    explicit
    updater (std::unique_ptr<state>);

  private:
    state&
    get ();

  private:
    std::unique_ptr<state> state_;
  };

  // Entry points.
  //
  // Each validates the options (throwing std::invalid_argument) and starts
  // the run in the background. Everything else is reported through the
  // updater.

  // Bring the destination to the build, reusing whatever is already there
  // and intact.
  //
  updater
  install (build_source, std::filesystem::path destination, options = {});

  // As above for a destination holding the previous build: moved files are
  // renamed, chunks are extracted from the old files where possible and
  // files the new build no longer has are deleted.
  //
  updater
  update (build_source previous,
          build_source target,
          std::filesystem::path destination,
          options = {});

  // Hash every file, then fix the broken ones.
  //
  updater
  repair (build_source, std::filesystem::path destination, options = {});

  // Download the chunks a later install or update of this build will need
  // into .chunks/ without touching any file.
  //
  updater
  predownload (build_source, std::filesystem::path destination, options = {});

  // As above for a later update of a destination holding the previous
  // build. Chunks the installed files already carry are left for the
  // update to extract.
  //
  updater
  predownload (build_source previous,
               build_source target,
               std::filesystem::path destination,
               options = {});
}
