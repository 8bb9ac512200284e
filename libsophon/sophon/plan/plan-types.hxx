#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <sophon/manifest/manifest-types.hxx>

namespace sophon
{
  enum class step_kind
  {
    fetch_chunk,
    extract_chunk,
    assemble_file,
    rename_file,
    delete_file
  };

  inline std::ostream&
  operator<< (std::ostream& os, step_kind k)
  {
    switch (k)
    {
      case step_kind::fetch_chunk:   return os << "fetch";
      case step_kind::extract_chunk: return os << "extract";
      case step_kind::assemble_file: return os << "assemble";
      case step_kind::rename_file:   return os << "rename";
      case step_kind::delete_file:   return os << "delete";
    }
    return os;
  }

  // Plan step.
  //
  // Which members are meaningful depends on the kind:
  //
  //   fetch_chunk    chunk
  //   extract_chunk  chunk, path (installed old-build file), offset, length
  //   assemble_file  file
  //   rename_file    source, path (target)
  //   delete_file    path
  //
  struct plan_step
  {
    step_kind kind;

    chunk_id chunk;
    std::string path;
    std::string source;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    // Points into the target manifest which outlives the plan.
    //
    const file_entry* file = nullptr;

    static plan_step
    fetch (chunk_id id)
    {
      plan_step s {step_kind::fetch_chunk};
      s.chunk = std::move (id);
      return s;
    }

    static plan_step
    extract (chunk_id id, std::string from, std::uint64_t o, std::uint64_t n)
    {
      plan_step s {step_kind::extract_chunk};
      s.chunk = std::move (id);
      s.path = std::move (from);
      s.offset = o;
      s.length = n;
      return s;
    }

    static plan_step
    assemble (const file_entry& f)
    {
      plan_step s {step_kind::assemble_file};
      s.path = f.path;
      s.file = &f;
      return s;
    }

    static plan_step
    rename (std::string from, std::string to)
    {
      plan_step s {step_kind::rename_file};
      s.source = std::move (from);
      s.path = std::move (to);
      return s;
    }

    static plan_step
    remove (std::string p)
    {
      plan_step s {step_kind::delete_file};
      s.path = std::move (p);
      return s;
    }
  };

  std::ostream&
  operator<< (std::ostream&, const plan_step&);

  // Ordered plan.
  //
  // Extractions come first, then renames, then fetches with each assembly
  // placed right after the fetch of its last missing chunk, then deletions.
  // Every chunk an assembly needs is either fetched or extracted earlier or
  // already stored.
  //
  struct plan
  {
    std::vector<plan_step> steps;

    // Files of the target manifest that were missing or did not match.
    //
    std::vector<std::string> broken;

    std::size_t fetches = 0;
    std::size_t extracts = 0;
    std::size_t assemblies = 0;

    // Payload bytes to download, decompressed bytes entering the chunk
    // store, and bytes of assembled files.
    //
    std::uint64_t fetch_bytes = 0;
    std::uint64_t store_bytes = 0;
    std::uint64_t assemble_bytes = 0;

    bool
    empty () const noexcept
    {
      return steps.empty ();
    }

    std::size_t
    count (step_kind) const;
  };
}
