#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace sophon
{
  // Chunk identifier: the MD5 of the decompressed chunk content as 32
  // lowercase hex digits.
  //
  using chunk_id = std::string;

  enum class chunk_compression
  {
    none,
    zstd
  };

  enum class chunk_encryption
  {
    none,
    password
  };

  inline std::ostream&
  operator<< (std::ostream& os, chunk_compression c)
  {
    return os << (c == chunk_compression::zstd ? "zstd" : "none");
  }

  inline std::ostream&
  operator<< (std::ostream& os, chunk_encryption e)
  {
    return os << (e == chunk_encryption::password ? "password" : "none");
  }

  // Chunk descriptor.
  //
  // The fetch URL is the download prefix followed by '/' and url_suffix (the
  // vendor chunk name, which is not the id).
  //
  struct chunk
  {
    chunk_id id;
    std::string url_suffix;

    std::uint64_t compressed_size = 0;
    std::uint64_t decompressed_size = 0;

    chunk_compression compression = chunk_compression::none;
    chunk_encryption encryption = chunk_encryption::none;

    // MD5 and xxHash of the payload as transferred. Optional, empty/zero if
    // the manifest does not carry them.
    //
    std::string compressed_md5;
    std::uint64_t compressed_xxh = 0;

    bool
    operator== (const chunk&) const = default;
  };

  // Placement of a chunk inside a file. The length is always the chunk's
  // decompressed size.
  //
  struct chunk_ref
  {
    chunk_id id;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool
    operator== (const chunk_ref&) const = default;
  };

  struct file_entry
  {
    // Relative POSIX path.
    //
    std::string path;
    std::uint64_t size = 0;

    // Whole-file MD5 as lowercase hex.
    //
    std::string md5;

    // Chunk references ordered by offset, contiguous from 0.
    //
    std::vector<chunk_ref> chunks;

    // Vendor asset type, carried through unchanged.
    //
    std::int32_t type = 0;

    bool
    operator== (const file_entry&) const = default;
  };

  // Decoded manifest.
  //
  // Files and chunks are kept in declared order (the planner's tie-breaks
  // depend on it). Call link() after modifying either vector to rebuild the
  // lookup indexes.
  //
  class manifest
  {
  public:
    std::string id;
    std::string tag;
    std::string build_id;

    std::vector<file_entry> files;
    std::vector<chunk> chunks;

    // Rebuild the path and chunk id indexes. Throw failure with
    // malformed_manifest on a duplicate path or a chunk id declared twice
    // with different properties (identical repeats are collapsed).
    //
    void
    link ();

    const file_entry*
    find_file (const std::string& path) const;

    const chunk*
    find_chunk (const chunk_id&) const;

    // Aggregates over all chunk references, so a chunk shared between files
    // is counted once per reference.
    //
    std::uint64_t
    total_bytes_compressed () const;

    std::uint64_t
    total_bytes_decompressed () const;

    std::uint64_t
    total_chunks () const;

    std::uint64_t
    total_files () const
    {
      return files.size ();
    }

    friend bool
    operator== (const manifest& x, const manifest& y)
    {
      return x.id == y.id &&
             x.tag == y.tag &&
             x.build_id == y.build_id &&
             x.files == y.files &&
             x.chunks == y.chunks;
    }

  private:
    std::unordered_map<std::string, std::size_t> file_index_;
    std::unordered_map<chunk_id, std::size_t> chunk_index_;
  };

  struct file_rename
  {
    std::string from;
    std::string to;

    bool
    operator== (const file_rename&) const = default;
  };

  // Delta between two builds.
  //
  // Files lists new or changed entries only. Their chunks are resolved
  // against the chunks of the new manifest or extracted from installed
  // old-build files.
  //
  struct diff_manifest
  {
    std::string from_build_id;
    std::string to_build_id;

    std::vector<file_entry> files;
    std::vector<std::string> deletions;
    std::vector<file_rename> renames;
  };

  // Derive the delta from two full manifests.
  //
  // A rename is recorded when an old path disappears and a new path with the
  // same size and MD5 appears; the new path is then not listed in files.
  //
  diff_manifest
  compute_diff (const manifest& old_m, const manifest& new_m);

  // Return true if the path is a relative POSIX path without empty, '.' or
  // '..' components and outside the reserved .chunks/ and .staging/
  // directories.
  //
  bool
  valid_path (const std::string&);
}
