#include <sophon/manifest/manifest-types.hxx>

#include <map>
#include <unordered_set>
#include <utility>

#include <sophon/sophon-error.hxx>

using namespace std;

namespace sophon
{
  void manifest::
  link ()
  {
    file_index_.clear ();
    chunk_index_.clear ();

    for (size_t i (0); i != files.size (); ++i)
    {
      if (!file_index_.emplace (files[i].path, i).second)
        throw_malformed ("duplicate file path " + files[i].path);
    }

    // Collapse identical redeclarations, keeping the first position.
    //
    vector<chunk> cs;
    cs.reserve (chunks.size ());

    for (chunk& c: chunks)
    {
      auto i (chunk_index_.find (c.id));

      if (i == chunk_index_.end ())
      {
        chunk_index_.emplace (c.id, cs.size ());
        cs.push_back (move (c));
      }
      else if (cs[i->second].compressed_size != c.compressed_size ||
               cs[i->second].decompressed_size != c.decompressed_size)
        throw_malformed ("conflicting declarations of chunk " + c.id);
    }

    chunks = move (cs);
  }

  const file_entry* manifest::
  find_file (const string& p) const
  {
    auto i (file_index_.find (p));
    return i != file_index_.end () ? &files[i->second] : nullptr;
  }

  const chunk* manifest::
  find_chunk (const chunk_id& id) const
  {
    auto i (chunk_index_.find (id));
    return i != chunk_index_.end () ? &chunks[i->second] : nullptr;
  }

  uint64_t manifest::
  total_bytes_compressed () const
  {
    uint64_t r (0);

    for (const file_entry& f: files)
    {
      for (const chunk_ref& cr: f.chunks)
      {
        if (const chunk* c = find_chunk (cr.id))
          r += c->compressed_size;
      }
    }

    return r;
  }

  uint64_t manifest::
  total_bytes_decompressed () const
  {
    uint64_t r (0);

    for (const file_entry& f: files)
      for (const chunk_ref& cr: f.chunks)
        r += cr.length;

    return r;
  }

  uint64_t manifest::
  total_chunks () const
  {
    uint64_t r (0);

    for (const file_entry& f: files)
      r += f.chunks.size ();

    return r;
  }

  diff_manifest
  compute_diff (const manifest& o, const manifest& n)
  {
    diff_manifest r;
    r.from_build_id = o.build_id;
    r.to_build_id = n.build_id;

    // Old files that disappear, keyed by (size, md5) for rename detection.
    //
    multimap<pair<uint64_t, string>, string> gone;

    for (const file_entry& f: o.files)
    {
      if (n.find_file (f.path) == nullptr)
        gone.emplace (make_pair (f.size, f.md5), f.path);
    }

    for (const file_entry& f: n.files)
    {
      const file_entry* of (o.find_file (f.path));

      if (of != nullptr)
      {
        if (of->size != f.size || of->md5 != f.md5)
          r.files.push_back (f);

        continue;
      }

      // Empty files are cheaper to create than to track.
      //
      auto i (f.size != 0
              ? gone.find (make_pair (f.size, f.md5))
              : gone.end ());

      if (i != gone.end ())
      {
        r.renames.push_back (file_rename {i->second, f.path});
        gone.erase (i);
      }
      else
        r.files.push_back (f);
    }

    // Report deletions in old manifest order.
    //
    unordered_set<string> ds;
    for (const auto& g: gone)
      ds.insert (g.second);

    for (const file_entry& f: o.files)
    {
      if (ds.count (f.path) != 0)
        r.deletions.push_back (f.path);
    }

    return r;
  }

  bool
  valid_path (const string& p)
  {
    if (p.empty () || p.front () == '/' || p.find ('\\') != string::npos)
      return false;

    if (p.find ('\0') != string::npos)
      return false;

    size_t b (0);
    bool first (true);

    for (;;)
    {
      size_t e (p.find ('/', b));
      string c (p, b, e == string::npos ? string::npos : e - b);

      if (c.empty () || c == "." || c == "..")
        return false;

      if (first && (c == ".chunks" || c == ".staging"))
        return false;

      first = false;

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return true;
  }
}
