#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sophon
{
  namespace fs = std::filesystem;

  // Local destination filesystem driver.
  //
  // All operations take paths relative to the destination root (as they
  // appear in manifests) and throw failure with the filesystem kind on I/O
  // errors. Read-only targets are made writable before they are replaced or
  // removed.
  //
  class destination
  {
  public:
    explicit
    destination (fs::path root);

    const fs::path&
    root () const noexcept
    {
      return root_;
    }

    fs::path
    path (const std::string& rel) const
    {
      return root_ / fs::path (rel);
    }

    fs::path
    chunk_dir () const
    {
      return root_ / ".chunks";
    }

    fs::path
    staging_dir () const
    {
      return root_ / ".staging";
    }

    bool
    exists (const std::string& rel) const;

    // Size of a regular file or nullopt if there is none at this path.
    //
    std::optional<std::uint64_t>
    size (const std::string& rel) const;

    std::string
    read (const std::string& rel) const;

    // Write and sync the whole file, creating parent directories.
    //
    void
    write (const std::string& rel, std::string_view data);

    // Move a file, replacing the target. Parent directories of the target
    // are created.
    //
    void
    rename (const std::string& from, const std::string& to);

    // Move a file from outside the tree (e.g., a staging file) into place.
    //
    void
    install (const fs::path& from, const std::string& to);

    void
    create_dir_all (const std::string& rel);

    // Remove a file. Removing a missing file is not an error.
    //
    void
    remove (const std::string& rel);

    // Names of the entries of a directory, sorted.
    //
    std::vector<std::string>
    list_dir (const std::string& rel) const;

    // Bytes available to us on the destination filesystem.
    //
    std::uint64_t
    available () const;

  private:
    fs::path root_;
  };

  // Add the owner write permission if the file exists and lacks it.
  //
  void
  make_writable (const fs::path&);

  // Flush file data to the storage device.
  //
  void
  sync_file (const fs::path&);
}
