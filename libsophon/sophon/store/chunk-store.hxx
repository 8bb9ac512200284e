#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include <sophon/manifest/manifest-types.hxx>

namespace sophon
{
  namespace fs = std::filesystem;

  // Content-addressed cache of decompressed chunks.
  //
  // Layout:
  //
  //   <dir>/<id>             stored chunk, content verified against the id
  //   <dir>/<id>.part        in-flight fetch (compressed, as served)
  //   <dir>/<id>.tmp.<uuid>  in-flight insert (decompressed)
  //
  // A stored chunk only ever appears through an fsync-ed rename of a
  // temporary file so whatever probe() finds is complete. Inserts of the
  // same id are serialized; a writer that finds the chunk already stored
  // discards its data.
  //
  // Reference counts are set by the coordinator from the plan. When eviction
  // is enabled a chunk whose count drops to zero is unlinked. Eviction is a
  // hint: callers must probe() again rather than assume presence.
  //
  class chunk_store
  {
  public:
    // Create the directory if necessary.
    //
    chunk_store (fs::path dir, bool evict);

    chunk_store (const chunk_store&) = delete;
    chunk_store& operator= (const chunk_store&) = delete;

    const fs::path&
    directory () const noexcept
    {
      return dir_;
    }

    fs::path
    chunk_path (const chunk_id& id) const
    {
      return dir_ / id;
    }

    fs::path
    part_path (const chunk_id& id) const
    {
      return dir_ / (id + ".part");
    }

    fs::path
    temp_path (const chunk_id& id, const std::string& unique) const
    {
      return dir_ / (id + ".tmp." + unique);
    }

    bool
    probe (const chunk_id&) const;

    // Verify that the bytes hash to the id and store them. Throw failure
    // with checksum_mismatch (chunk scope) on mismatch or filesystem on I/O
    // errors.
    //
    void
    insert (const chunk_id&, std::string_view bytes);

    // As above for bytes the caller has already verified while streaming.
    //
    void
    insert_verified (const chunk_id&, std::string_view bytes);

    // Open a stored chunk for reading. Return nullopt if it is missing.
    //
    std::optional<std::ifstream>
    open_read (const chunk_id&) const;

    // Size of the partial download for this chunk, 0 if there is none.
    //
    std::uint64_t
    part_size (const chunk_id&) const;

    void
    discard_part (const chunk_id&);

    // Re-hash a stored chunk. If it does not match its id it is removed and
    // false is returned. A missing chunk also yields false.
    //
    bool
    verify (const chunk_id&);

    // Reference counting.
    //
    void
    retain (const chunk_id&, std::uint32_t n = 1);

    // Decrement the count and, if it reaches zero and eviction is enabled,
    // unlink the chunk. Return true if the chunk was evicted.
    //
    bool
    release (const chunk_id&);

    std::uint32_t
    references (const chunk_id&) const;

    // Unlink a stored chunk regardless of its count.
    //
    void
    evict (const chunk_id&);

    // Remove the whole directory.
    //
    void
    remove_all ();

  private:
    void
    commit (const chunk_id&, std::string_view bytes);

  private:
    fs::path dir_;
    bool evict_;

    mutable std::mutex refs_mutex_;
    std::unordered_map<chunk_id, std::uint32_t> refs_;

    std::mutex insert_mutex_;
    std::condition_variable insert_cv_;
    std::unordered_set<chunk_id> inserting_;
  };
}
