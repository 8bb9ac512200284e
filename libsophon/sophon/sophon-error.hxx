#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace sophon
{
  // Failure taxonomy.
  //
  // Per-job retries are absorbed inside the fetcher and assembler pools so
  // only terminal outcomes of these kinds ever reach the caller.
  //
  enum class error_kind
  {
    malformed_manifest,
    unresolvable_chunk,
    network,
    checksum_mismatch,
    filesystem,
    cancelled,
    no_space,
    unsupported,

    // Anything else that went wrong: out of memory, an unexpected exception
    // from a library.
    //
    internal
  };

  std::ostream&
  operator<< (std::ostream&, error_kind);

  enum class checksum_scope
  {
    chunk,
    file
  };

  inline std::ostream&
  operator<< (std::ostream& os, checksum_scope s)
  {
    return os << (s == checksum_scope::chunk ? "chunk" : "file");
  }

  // Structured failure reason.
  //
  // Only the fields relevant to the kind are set. The detail member carries
  // auxiliary text (a vendor message, the offending manifest field) and is
  // never the only information about the failure.
  //
  struct error
  {
    error_kind kind = error_kind::filesystem;

    // Network errors: whether another attempt may succeed.
    //
    bool retriable = false;

    // Checksum errors: what failed verification.
    //
    std::optional<checksum_scope> scope;

    std::string chunk;
    std::filesystem::path path;
    std::uint16_t http_status = 0;
    std::error_code system_error;

    // No-space errors: bytes the plan needs and bytes available.
    //
    std::uint64_t required = 0;
    std::uint64_t available = 0;

    std::string detail;

    static error
    malformed (std::string detail);

    static error
    unresolvable (std::string chunk);

    static error
    network (bool retriable,
             std::string detail,
             std::uint16_t status = 0,
             std::error_code ec = {});

    static error
    checksum (checksum_scope, std::string chunk, std::filesystem::path = {});

    static error
    fs (std::filesystem::path, std::error_code, std::string detail = {});

    static error
    cancel ();

    static error
    no_space (std::uint64_t required, std::uint64_t available);

    static error
    unsupported (std::string detail);

    static error
    internal (std::string detail);
  };

  std::ostream&
  operator<< (std::ostream&, const error&);

  std::string
  to_string (const error&);

  // Exception carrying a structured error.
  //
  class failure: public std::runtime_error
  {
  public:
    explicit
    failure (error);

    const error&
    reason () const noexcept
    {
      return error_;
    }

  private:
    error error_;
  };

  [[noreturn]] void
  throw_malformed (std::string detail);

  [[noreturn]] void
  throw_fs (const std::filesystem::path&,
            std::error_code,
            std::string detail = {});

  [[noreturn]] void
  throw_cancelled ();
}
