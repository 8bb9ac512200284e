#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include <sophon/manifest/manifest-types.hxx>
#include <sophon/plan/plan-types.hxx>
#include <sophon/filesystem/destination.hxx>
#include <sophon/store/chunk-store.hxx>

namespace sophon
{
  // State of an installed file relative to its manifest entry.
  //
  enum class file_state
  {
    intact,
    missing,
    wrong_size,
    mismatch
  };

  std::ostream&
  operator<< (std::ostream&, file_state);

  using file_check_callback =
    std::function<void (const file_entry&, file_state)>;

  // Check every file of the manifest at the destination using a pool of
  // threads. If hash is false a file with the right size counts as intact.
  // The callback, if any, is called from the pool threads.
  //
  std::vector<file_state>
  check_files (const manifest&,
               const destination&,
               bool hash,
               unsigned threads,
               const file_check_callback& = {},
               const std::atomic<bool>* cancel = nullptr);

  // Return paths of files that are missing, wrongly sized or have a
  // mismatching MD5. Nothing is modified.
  //
  std::vector<std::string>
  verify (const manifest&, const destination&, unsigned threads);

  struct plan_options
  {
    bool verify_existing = true;

    // Threads for hashing existing files.
    //
    unsigned threads = 4;

    // Plan assemblies along with the renames, deletions and extractions
    // that touch installed files. Off when only pre-downloading chunks, in
    // which case chunks the installed previous build carries are not
    // fetched either.
    //
    bool assemble = true;

    // Called for every file checked, from the hashing threads.
    //
    file_check_callback on_check;
    const std::atomic<bool>* cancel = nullptr;
  };

  // Build the plan that turns the destination into the target tree.
  //
  // With a previous manifest the destination is assumed to hold that build:
  // disappeared files are deleted, moved files renamed, and chunks found
  // inside installed old files are extracted instead of fetched.
  //
  // Throw failure with unresolvable_chunk if a needed chunk is neither
  // declared, stored nor extractable.
  //
  plan
  make_plan (const manifest& target,
             const manifest* previous,
             const destination&,
             const chunk_store&,
             const plan_options&);
}
