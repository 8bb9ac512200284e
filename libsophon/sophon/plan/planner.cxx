#include <sophon/plan/planner.hxx>

#include <algorithm>
#include <latch>
#include <limits>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <sophon/sophon-error.hxx>
#include <sophon/hash/hash.hxx>

using namespace std;

namespace sophon
{
  namespace asio = boost::asio;

  ostream&
  operator<< (ostream& os, file_state s)
  {
    switch (s)
    {
      case file_state::intact:     return os << "intact";
      case file_state::missing:    return os << "missing";
      case file_state::wrong_size: return os << "wrong size";
      case file_state::mismatch:   return os << "checksum mismatch";
    }
    return os;
  }

  ostream&
  operator<< (ostream& os, const plan_step& s)
  {
    os << s.kind << ' ';

    switch (s.kind)
    {
    case step_kind::fetch_chunk:
      return os << s.chunk;
    case step_kind::extract_chunk:
      return os << s.chunk << " from " << s.path << '@' << s.offset;
    case step_kind::rename_file:
      return os << s.source << " -> " << s.path;
    case step_kind::assemble_file:
    case step_kind::delete_file:
      return os << s.path;
    }

    return os;
  }

  size_t plan::
  count (step_kind k) const
  {
    return static_cast<size_t> (
      count_if (steps.begin (), steps.end (),
                [k] (const plan_step& s) {return s.kind == k;}));
  }

  static file_state
  check_file (const file_entry& f, const destination& d, bool hash)
  {
    optional<uint64_t> n (d.size (f.path));

    if (!n)
      return file_state::missing;

    if (*n != f.size)
      return file_state::wrong_size;

    if (hash && !compare_hashes (md5_file (d.path (f.path)), f.md5))
      return file_state::mismatch;

    return file_state::intact;
  }

  vector<file_state>
  check_files (const manifest& m,
               const destination& d,
               bool hash,
               unsigned threads,
               const file_check_callback& cb,
               const atomic<bool>* cancel)
  {
    vector<file_state> r (m.files.size (), file_state::missing);

    if (m.files.empty ())
      return r;

    if (threads == 0)
    {
      threads = thread::hardware_concurrency ();
      if (threads == 0) threads = 4;
    }

    // Size checks are cheap, hashing is not. Fork the per-file work out to
    // a pool and fence on a latch before anyone looks at the results.
    //
    asio::thread_pool pool (threads);
    latch l (static_cast<ptrdiff_t> (m.files.size ()));

    for (size_t i (0); i != m.files.size (); ++i)
    {
      asio::post (pool,
                  [&m, &d, &r, &l, &cb, hash, cancel, i] ()
      {
        const file_entry& f (m.files[i]);

        // A file we cannot read is as good as missing.
        //
        if (cancel == nullptr || !cancel->load ())
        {
          try
          {
            r[i] = check_file (f, d, hash);
          }
          catch (const exception&)
          {
            r[i] = file_state::mismatch;
          }

          if (cb)
            cb (f, r[i]);
        }

        l.count_down ();
      });
    }

    l.wait ();
    pool.join ();

    if (cancel != nullptr && cancel->load ())
      throw_cancelled ();

    return r;
  }

  vector<string>
  verify (const manifest& m, const destination& d, unsigned threads)
  {
    vector<file_state> ss (check_files (m, d, true, threads));
    vector<string> r;

    for (size_t i (0); i != ss.size (); ++i)
    {
      if (ss[i] != file_state::intact)
        r.push_back (m.files[i].path);
    }

    return r;
  }

  plan
  make_plan (const manifest& t,
             const manifest* prev,
             const destination& d,
             const chunk_store& store,
             const plan_options& o)
  {
    plan r;

    vector<file_state> ss (
      check_files (t, d, o.verify_existing, o.threads, o.on_check, o.cancel));

    // Renames and deletions only make sense relative to a known previous
    // build.
    //
    diff_manifest diff;
    if (prev != nullptr)
      diff = compute_diff (*prev, t);

    unordered_map<string, string> renames; // Target to source.
    for (const file_rename& x: diff.renames)
      renames.emplace (x.to, x.from);

    vector<plan_step> rename_steps;
    vector<plan_step> delete_steps;

    // Files that need assembly, in manifest order.
    //
    vector<const file_entry*> work;

    for (size_t i (0); i != t.files.size (); ++i)
    {
      const file_entry& f (t.files[i]);

      if (ss[i] == file_state::intact)
        continue;

      r.broken.push_back (f.path);

      auto j (renames.find (f.path));
      if (j != renames.end ())
      {
        const file_entry* of (prev->find_file (j->second));

        // The source must be exactly the content we want.
        //
        if (of != nullptr &&
            check_file (*of, d, o.verify_existing) == file_state::intact)
        {
          if (o.assemble)
            rename_steps.push_back (plan_step::rename (j->second, f.path));
          continue;
        }

        // The source is unusable. Whatever is left of it goes.
        //
        if (o.assemble && d.exists (j->second))
          delete_steps.push_back (plan_step::remove (j->second));
      }

      work.push_back (&f);
    }

    for (const string& p: diff.deletions)
    {
      if (o.assemble && d.exists (p))
        delete_steps.push_back (plan_step::remove (p));
    }

    // Where each chunk can be found inside the installed old build. Only
    // files present with their old size are trusted; the extracted bytes
    // are verified against the id anyway.
    //
    struct location
    {
      const file_entry* file;
      uint64_t offset;
      uint64_t length;
    };

    unordered_map<chunk_id, location> old_chunks;

    if (prev != nullptr)
    {
      for (const file_entry& of: prev->files)
      {
        if (of.chunks.empty ())
          continue;

        optional<uint64_t> n (d.size (of.path));
        if (!n || *n != of.size)
          continue;

        for (const chunk_ref& cr: of.chunks)
          old_chunks.emplace (cr.id, location {&of, cr.offset, cr.length});
      }
    }

    // Resolve the chunks of the files to assemble.
    //
    unordered_set<chunk_id> fetch_set;
    unordered_set<chunk_id> resolved;

    for (const file_entry* f: work)
    {
      for (const chunk_ref& cr: f->chunks)
      {
        if (!resolved.insert (cr.id).second)
          continue;

        if (store.probe (cr.id))
          continue;

        auto k (old_chunks.find (cr.id));
        if (k != old_chunks.end ())
        {
          // Left in place for the update to extract.
          //
          if (!o.assemble)
            continue;

          r.steps.push_back (plan_step::extract (cr.id,
                                                 k->second.file->path,
                                                 k->second.offset,
                                                 k->second.length));
          r.extracts++;
          r.store_bytes += cr.length;
          continue;
        }

        if (t.find_chunk (cr.id) == nullptr)
          throw failure (error::unresolvable (cr.id));

        fetch_set.insert (cr.id);
      }
    }

    for (plan_step& s: rename_steps)
      r.steps.push_back (move (s));

    // Fetch in manifest-declared order.
    //
    vector<const chunk*> fetches;
    unordered_map<chunk_id, size_t> fetch_index;

    for (const chunk& c: t.chunks)
    {
      if (fetch_set.count (c.id) != 0)
      {
        fetch_index.emplace (c.id, fetches.size ());
        fetches.push_back (&c);
      }
    }

    // Place each assembly right after its last fetch, ordering assemblies
    // that share the same last fetch by their first one. Files that need no
    // fetch at all go first.
    //
    constexpr size_t none (numeric_limits<size_t>::max ());

    struct slot
    {
      size_t first;
      size_t last;
      const file_entry* file;
    };

    vector<slot> slots;

    if (o.assemble)
    {
      for (const file_entry* f: work)
      {
        slot s {none, none, f};

        for (const chunk_ref& cr: f->chunks)
        {
          auto k (fetch_index.find (cr.id));
          if (k == fetch_index.end ())
            continue;

          if (s.first == none || k->second < s.first) s.first = k->second;
          if (s.last == none || k->second > s.last)   s.last = k->second;
        }

        slots.push_back (s);
      }

      stable_sort (slots.begin (), slots.end (),
                   [none] (const slot& x, const slot& y)
                   {
                     // none sorts first for files without fetches.
                     //
                     size_t xl (x.last == none ? 0 : x.last + 1);
                     size_t yl (y.last == none ? 0 : y.last + 1);

                     if (xl != yl)
                       return xl < yl;

                     return (x.first == none ? 0 : x.first + 1) <
                            (y.first == none ? 0 : y.first + 1);
                   });
    }

    auto assemble = [&r] (const file_entry& f)
    {
      r.steps.push_back (plan_step::assemble (f));
      r.assemblies++;
      r.assemble_bytes += f.size;
    };

    size_t si (0);

    for (; si != slots.size () && slots[si].last == none; ++si)
      assemble (*slots[si].file);

    for (size_t i (0); i != fetches.size (); ++i)
    {
      r.steps.push_back (plan_step::fetch (fetches[i]->id));
      r.fetches++;
      r.fetch_bytes += fetches[i]->compressed_size;
      r.store_bytes += fetches[i]->decompressed_size;

      for (; si != slots.size () && slots[si].last == i; ++si)
        assemble (*slots[si].file);
    }

    for (plan_step& s: delete_steps)
      r.steps.push_back (move (s));

    return r;
  }
}
