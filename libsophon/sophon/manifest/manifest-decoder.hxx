#pragma once

#include <string>
#include <string_view>

#include <sophon/manifest/manifest-types.hxx>

namespace sophon
{
  // Decode an (already decompressed) manifest record stream.
  //
  // The record stream does not carry transfer properties so the chunk
  // compression and encryption are taken from the enclosing download info
  // and applied to every chunk.
  //
  // Throw failure with malformed_manifest if the stream is truncated or
  // carries unknown records or fields, a path is invalid or duplicate, a
  // digest is not a valid MD5, a chunk is declared inconsistently, or the
  // chunks of a file are not contiguous from 0 up to its size.
  //
  manifest
  decode_manifest (std::string_view bytes,
                   chunk_compression = chunk_compression::none,
                   chunk_encryption = chunk_encryption::none);

  // Produce the record stream decode_manifest() reads. Identity fields (id,
  // tag, build id) live in the envelope and are not encoded.
  //
  // Throw std::invalid_argument if a file references an undeclared chunk.
  //
  std::string
  encode_manifest (const manifest&);
}
