#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace sophon
{
  // Incremental MD5 over the OpenSSL EVP interface.
  //
  // Chunk ids and file checksums are both MD5 digests rendered as 32
  // lowercase hex digits, so that is what finish() returns.
  //
  class md5
  {
  public:
    md5 ();
    ~md5 ();

    md5 (md5&&) noexcept;
    md5& operator= (md5&&) noexcept;

    md5 (const md5&) = delete;
    md5& operator= (const md5&) = delete;

    void
    update (const void* data, std::size_t size);

    void
    update (std::string_view s)
    {
      update (s.data (), s.size ());
    }

    // Finalize and return the hex digest. The object is reset and can be
    // reused for another digest.
    //
    std::string
    finish ();

  private:
    EVP_MD_CTX* ctx_;
  };

  std::string
  md5_hex (const void* data, std::size_t size);

  inline std::string
  md5_hex (std::string_view s)
  {
    return md5_hex (s.data (), s.size ());
  }

  // Hash a whole file. Return empty string if the file does not exist or
  // cannot be read.
  //
  std::string
  md5_file (const std::filesystem::path&);

  // Hash length bytes of a file starting at offset. Return empty string if
  // the file cannot be read or is too short.
  //
  std::string
  md5_file_range (const std::filesystem::path&,
                  std::uint64_t offset,
                  std::uint64_t length);

  // Case-insensitive digest comparison.
  //
  bool
  compare_hashes (std::string_view, std::string_view);

  // True if s is a 32-digit hex MD5 digest.
  //
  bool
  valid_md5 (std::string_view s);
}
