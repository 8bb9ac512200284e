#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include <sophon/manifest/manifest-types.hxx>

namespace sophon
{
  // Transfer properties of a group of downloadable objects (chunks or the
  // manifest blob itself).
  //
  struct download_info
  {
    // Non-zero values are reserved for a password-based scheme the vendor
    // has not specified. Runs reject them.
    //
    std::uint8_t encryption = 0;
    std::string password;

    // 1 means zstd.
    //
    std::uint8_t compression = 0;

    std::string url_prefix;
    std::string url_suffix;

    // URL of the named object under this prefix.
    //
    std::string
    url (const std::string& name) const
    {
      return url_prefix + url_suffix + '/' + name;
    }

    chunk_compression
    chunk_compression_type () const noexcept
    {
      return compression == 1 ? chunk_compression::zstd
                              : chunk_compression::none;
    }

    chunk_encryption
    chunk_encryption_type () const noexcept
    {
      return encryption != 0 ? chunk_encryption::password
                             : chunk_encryption::none;
    }
  };

  // Summary statistics the vendor publishes alongside a manifest.
  //
  struct manifest_stats
  {
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t file_count = 0;
    std::uint64_t chunk_count = 0;
  };

  // Manifest blob reference.
  //
  struct manifest_blob
  {
    std::string id;
    std::string checksum;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
  };

  // One downloadable component of a build (the game itself or a voiceover
  // pack, distinguished by matching_field).
  //
  struct build_manifest
  {
    std::string category_id;
    std::string category_name;
    std::string matching_field;

    manifest_blob manifest;
    download_info chunk_download;
    download_info manifest_download;

    std::optional<manifest_stats> stats;
    std::optional<manifest_stats> deduplicated_stats;

    std::string
    manifest_url () const
    {
      return manifest_download.url (manifest.id);
    }
  };

  struct build_info
  {
    std::string build_id;
    std::string tag;
    std::vector<build_manifest> manifests;

    // Return nullptr if there is no such component.
    //
    const build_manifest*
    find (const std::string& matching_field) const;
  };

  // Parse the vendor build response.
  //
  // Both the {retcode, message, data} envelope and a bare data object are
  // accepted. Numeric values may be JSON numbers or decimal strings. Throw
  // failure with malformed_manifest on a non-zero retcode (carrying the
  // vendor message) or a structural mismatch.
  //
  build_info
  parse_build_info (const boost::json::value&);

  build_info
  parse_build_info (const std::string& json_text);

  download_info
  parse_download_info (const boost::json::value&);

  manifest_stats
  parse_manifest_stats (const boost::json::value&);
}
