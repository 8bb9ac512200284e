#include <sophon/coordinator/coordinator.hxx>

#include <fstream>
#include <future>
#include <iostream>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <sophon/sophon-error.hxx>
#include <sophon/hash/hash.hxx>
#include <sophon/manifest/manifest-codec.hxx>
#include <sophon/manifest/manifest-decoder.hxx>
#include <sophon/plan/planner.hxx>
#include <sophon/fetch/fetcher.hxx>
#include <sophon/assemble/assembler.hxx>

using namespace std;

namespace sophon
{
  ostream&
  operator<< (ostream& os, run_mode m)
  {
    switch (m)
    {
      case run_mode::install:     return os << "install";
      case run_mode::update:      return os << "update";
      case run_mode::repair:      return os << "repair";
      case run_mode::predownload: return os << "predownload";
    }
    return os;
  }

  mirror_set build_source::
  chunk_mirrors () const
  {
    vector<cdn_mirror> ms;

    if (!chunk_download.url_prefix.empty ())
      ms.push_back (cdn_mirror {chunk_download.url_prefix, 0});

    ms.insert (ms.end (), mirrors.begin (), mirrors.end ());

    if (ms.empty ())
      throw_malformed ("no chunk download URL");

    return mirror_set (move (ms));
  }

  build_source build_source::
  from (const build_info& b, const build_manifest& m)
  {
    build_source r;
    r.id = m.manifest.id;
    r.tag = b.tag;
    r.build_id = b.build_id;
    r.manifest_url = m.manifest_url ();
    r.manifest_checksum = m.manifest.checksum;
    r.manifest_zstd = m.manifest_download.compression == 1;
    r.chunk_download = m.chunk_download;
    r.stats = m.stats;
    return r;
  }

  coordinator::
  coordinator (run_mode m,
               build_source t,
               optional<build_source> p,
               fs::path root,
               options o,
               progress_updater& pu,
               atomic<bool>& cancel)
    : mode_ (m),
      target_src_ (move (t)),
      previous_src_ (move (p)),
      root_ (move (root)),
      opts_ (move (o)),
      progress_ (pu),
      cancel_ (cancel),
      net_ (ioc_, opts_)
  {
  }

  void coordinator::
  check_cancel () const
  {
    if (cancel_.load ())
      throw_cancelled ();
  }

  asio::awaitable<fetched_blob> coordinator::
  download (const string& url)
  {
    retry_policy rp (retry_policy::from (opts_));

    for (uint32_t n (0);; ++n)
    {
      optional<error> e;
      try
      {
        co_return co_await net_.fetch_all (url, &cancel_);
      }
      catch (const failure& f)
      {
        e = f.reason ();
      }

      bool retry (e->kind == error_kind::network && e->retriable);

      if (!retry || n + 1 >= rp.max_attempts)
        throw failure (move (*e));

      chrono::milliseconds d (rp.delay (n + 1, 0.5));

      if (opts_.verbosity >= 1)
        cerr << "warning: manifest " << url << ": " << *e << "; retrying in "
             << d.count () << "ms" << endl;

      asio::steady_timer t (ioc_, d);
      co_await t.async_wait (asio::use_awaitable);

      if (cancel_.load ())
        throw_cancelled ();
    }
  }

  manifest coordinator::
  load (const build_source& s)
  {
    // We don't know how to decrypt anything yet.
    //
    if (s.chunk_download.encryption != 0)
      throw failure (error::unsupported (
        "chunk encryption " + std::to_string (s.chunk_download.encryption)));

    if (opts_.verbosity >= 2)
      cerr << "info: fetching manifest " << s.manifest_url << endl;

    future<fetched_blob> f (
      asio::co_spawn (ioc_, download (s.manifest_url), asio::use_future));

    ioc_.restart ();
    ioc_.run ();

    fetched_blob b (f.get ());

    string bytes (decode_manifest_blob (b.data,
                                        b.content_encoding,
                                        s.manifest_zstd));

    // The vendor checksum has been seen to cover either the blob as
    // transferred or its content.
    //
    if (!s.manifest_checksum.empty () &&
        !compare_hashes (md5_hex (b.data), s.manifest_checksum) &&
        !compare_hashes (md5_hex (bytes), s.manifest_checksum))
      throw_malformed ("manifest " + s.id + " does not match checksum " +
                       s.manifest_checksum);

    manifest m (decode_manifest (bytes,
                                 s.chunk_download.chunk_compression_type (),
                                 s.chunk_download.chunk_encryption_type ()));
    m.id = s.id;
    m.tag = s.tag;
    m.build_id = s.build_id;

    if (s.stats)
    {
      uint64_t size (0);
      for (const file_entry& e: m.files)
        size += e.size;

      if (m.total_files () != s.stats->file_count)
        throw_malformed ("manifest " + s.id + " has " +
                         std::to_string (m.total_files ()) +
                         " files, expected " +
                         std::to_string (s.stats->file_count));

      if (size != s.stats->uncompressed_size)
        throw_malformed ("manifest " + s.id + " totals " +
                         std::to_string (size) + " bytes, expected " +
                         std::to_string (s.stats->uncompressed_size));
    }

    if (opts_.verbosity >= 2)
      cerr << "info: manifest " << s.id << ": " << m.total_files ()
           << " files, " << m.chunks.size () << " chunks" << endl;

    return m;
  }

  bool coordinator::
  extract (destination& d, chunk_store& store, const plan_step& s)
  {
    fs::path p (d.path (s.path));
    string b;

    {
      ifstream ifs (p, ios::binary);
      if (ifs)
      {
        ifs.seekg (static_cast<streamoff> (s.offset));

        b.resize (static_cast<size_t> (s.length));
        ifs.read (b.data (), static_cast<streamsize> (s.length));

        if (static_cast<uint64_t> (ifs.gcount ()) != s.length)
          b.clear ();
      }
    }

    if (b.size () != s.length)
    {
      if (opts_.verbosity >= 1)
        cerr << "warning: unable to read chunk " << s.chunk << " from "
             << p << ", fetching instead" << endl;
      return false;
    }

    try
    {
      store.insert (s.chunk, b);
    }
    catch (const failure& e)
    {
      if (e.reason ().kind != error_kind::checksum_mismatch)
        throw;

      if (opts_.verbosity >= 1)
        cerr << "warning: " << s.path << " no longer carries chunk "
             << s.chunk << ", fetching instead" << endl;
      return false;
    }

    if (opts_.verbosity >= 3)
      cerr << "trace: extracted chunk " << s.chunk << " from " << s.path
           << endl;

    return true;
  }

  void coordinator::
  run ()
  {
    progress_.state (progress_state::planning);

    target_ = load (target_src_);

    if (previous_src_)
      previous_ = load (*previous_src_);

    check_cancel ();

    {
      error_code ec;
      fs::create_directories (root_, ec);
      if (ec)
        throw_fs (root_, ec, "unable to create destination");
    }

    destination dest (root_);

    // Predownloaded chunks are meant to stay.
    //
    bool keep (opts_.keep_chunk_cache || mode_ == run_mode::predownload);
    chunk_store store (dest.chunk_dir (), !keep);

    // Leftovers of an interrupted run are of no use, unlike .chunks/.
    //
    {
      error_code ec;
      fs::remove_all (dest.staging_dir (), ec);
      if (ec)
        throw_fs (dest.staging_dir (), ec, "unable to clean staging directory");

      fs::create_directories (dest.staging_dir (), ec);
      if (ec)
        throw_fs (dest.staging_dir (), ec, "unable to create staging directory");
    }

    if (mode_ == run_mode::repair)
      progress_.state (progress_state::verifying);

    plan_options po;
    po.verify_existing = opts_.verify_existing || mode_ == run_mode::repair;
    po.threads = opts_.assemblers ();
    po.assemble = mode_ != run_mode::predownload;
    po.cancel = &cancel_;
    po.on_check = [this] (const file_entry&, file_state)
    {
      progress_.file_checked ();
    };

    progress_.checks (target_.files.size ());

    plan_ = make_plan (target_,
                       previous_ ? &*previous_ : nullptr,
                       dest,
                       store,
                       po);

    const plan& p (plan_);

    if (opts_.verbosity >= 2)
      cerr << "info: " << mode_ << ": " << p.broken.size ()
           << " files to process, " << p.fetches << " chunks to fetch, "
           << p.extracts << " to extract" << endl;

    if (opts_.check_free_space)
    {
      uint64_t required (p.fetch_bytes + p.store_bytes + p.assemble_bytes);

      if (required != 0)
      {
        uint64_t available (dest.available ());

        if (required > available)
          throw failure (error::no_space (required, available));
      }
    }

    progress_.totals (p.fetch_bytes, p.assemblies, p.fetches);
    progress_.broken (p.broken.size ());

    // Extract before anything can touch the old files.
    //
    vector<chunk_id> extra;

    for (const plan_step& s: p.steps)
    {
      if (s.kind != step_kind::extract_chunk)
        continue;

      check_cancel ();

      if (!extract (dest, store, s))
        extra.push_back (s.chunk);
    }

    if (!extra.empty ())
    {
      uint64_t n (0);
      for (const chunk_id& id: extra)
      {
        if (const chunk* c = target_.find_chunk (id))
          n += c->compressed_size;
      }

      progress_.more (n, extra.size ());
    }

    for (const plan_step& s: p.steps)
    {
      if (s.kind != step_kind::rename_file)
        continue;

      check_cancel ();
      dest.rename (s.source, s.path);

      if (opts_.verbosity >= 2)
        cerr << "info: renamed " << s.source << " to " << s.path << endl;
    }

    execute (dest, store, extra);

    // Deletions only once everything else is in place.
    //
    for (const plan_step& s: p.steps)
    {
      if (s.kind != step_kind::delete_file)
        continue;

      check_cancel ();
      dest.remove (s.path);

      if (opts_.verbosity >= 2)
        cerr << "info: removed " << s.path << endl;
    }

    // Clean up. Failing that is not worth failing the run over.
    //
    {
      error_code ec;
      fs::remove_all (dest.staging_dir (), ec);
      if (ec && opts_.verbosity >= 1)
        cerr << "warning: unable to remove " << dest.staging_dir () << ": "
             << ec.message () << endl;
    }

    if (!keep)
    {
      try
      {
        store.remove_all ();
      }
      catch (const failure& e)
      {
        if (opts_.verbosity >= 1)
          cerr << "warning: " << e.reason () << endl;
      }
    }

    progress_.state (progress_state::done);
  }

  void coordinator::
  execute (destination& dest, chunk_store& store, const vector<chunk_id>& extra)
  {
    const plan& p (plan_);

    vector<const chunk*> fetches;

    for (const plan_step& s: p.steps)
    {
      if (s.kind == step_kind::fetch_chunk)
        fetches.push_back (target_.find_chunk (s.chunk));
    }

    // Chunks that could not be extracted after all.
    //
    for (const chunk_id& id: extra)
    {
      const chunk* c (target_.find_chunk (id));
      if (c == nullptr)
        throw failure (error::unresolvable (id));

      fetches.push_back (c);
    }

    unordered_set<chunk_id> fetch_ids;
    for (const chunk* c: fetches)
      fetch_ids.insert (c->id);

    // Dependency bookkeeping. A file goes to the assembler once every chunk
    // it waits for is stored.
    //
    mutex m;
    unordered_map<chunk_id, vector<const file_entry*>> waiting;
    unordered_map<const file_entry*, size_t> pending;
    unordered_map<const file_entry*, unsigned> attempts;
    size_t remaining (0);
    size_t stored (0);
    optional<error> first;

    vector<const file_entry*> ready;

    for (const plan_step& s: p.steps)
    {
      if (s.kind != step_kind::assemble_file)
        continue;

      const file_entry* f (s.file);

      unordered_set<chunk_id> ids;
      for (const chunk_ref& r: f->chunks)
        ids.insert (r.id);

      size_t& n (pending[f]);

      for (const chunk_id& id: ids)
      {
        store.retain (id);

        if (fetch_ids.count (id) != 0)
        {
          waiting[id].push_back (f);
          ++n;
        }
      }

      if (n == 0)
        ready.push_back (f);

      ++remaining;
    }

    if (fetches.empty () && remaining == 0)
      return;

    fetcher fch (ioc_,
                 net_,
                 store,
                 target_src_.chunk_mirrors (),
                 target_src_.chunk_download.url_suffix,
                 opts_,
                 progress_,
                 cancel_);

    assembler asmb (dest, store, opts_, progress_, cancel_);

    // The first terminal error wins and stops everyone else.
    //
    auto fail = [&m, &first, this] (const error& e)
    {
      {
        lock_guard<mutex> l (m);
        if (!first)
          first = e;
      }

      cancel_.store (true);
    };

    fch.on_failed = fail;
    asmb.on_failed = fail;

    fch.on_stored = [&] (const chunk_id& id)
    {
      vector<const file_entry*> r;
      {
        lock_guard<mutex> l (m);

        auto i (waiting.find (id));
        if (i != waiting.end ())
        {
          for (const file_entry* f: i->second)
          {
            if (--pending[f] == 0)
              r.push_back (f);
          }

          waiting.erase (i);
        }

        if (++stored == fetches.size () && remaining != 0)
          progress_.state (progress_state::assembling);
      }

      for (const file_entry* f: r)
        asmb.submit (*f);
    };

    asmb.on_done = [&] (const file_entry&)
    {
      lock_guard<mutex> l (m);

      if (--remaining == 0)
        fch.close ();
    };

    asmb.on_refetch = [&] (const file_entry& f, vector<chunk_id> bad)
    {
      bool give_up;
      {
        lock_guard<mutex> l (m);

        give_up = ++attempts[&f] >= opts_.max_retries;

        if (!give_up)
        {
          for (const chunk_id& id: bad)
          {
            waiting[id].push_back (&f);
            ++pending[&f];
          }
        }
      }

      if (give_up)
      {
        fail (error::checksum (checksum_scope::file, {}, f.path));
        return;
      }

      progress_.retry ();

      for (const chunk_id& id: bad)
      {
        const chunk* c (target_.find_chunk (id));
        if (c == nullptr)
        {
          fail (error::unresolvable (id));
          return;
        }

        if (opts_.verbosity >= 1)
          cerr << "warning: refetching chunk " << id << " for " << f.path
               << endl;

        fch.enqueue (*c);
      }
    };

    for (const chunk* c: fetches)
      fch.enqueue (*c);

    if (remaining == 0)
      fch.close ();

    progress_.state (fetches.empty () ? progress_state::assembling
                                      : progress_state::downloading);

    for (const file_entry* f: ready)
      asmb.submit (*f);

    fch.start ();

    ioc_.restart ();
    ioc_.run ();

    asmb.join ();

    {
      lock_guard<mutex> l (m);
      if (first)
        throw failure (*first);
    }

    check_cancel ();
  }
}
