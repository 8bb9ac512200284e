#include <sophon/fetch/fetcher.hxx>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <sophon/hash/hash.hxx>
#include <sophon/manifest/manifest-codec.hxx>

using namespace std;

namespace sophon
{
  // How often idle workers look for new work.
  //
  static const chrono::milliseconds idle_poll (50);

  fetcher::
  fetcher (asio::io_context& ioc,
           transport& net,
           chunk_store& store,
           mirror_set mirrors,
           string url_suffix,
           const options& o,
           progress_updater& progress,
           atomic<bool>& cancel)
    : ioc_ (ioc),
      net_ (net),
      store_ (store),
      mirrors_ (move (mirrors)),
      url_suffix_ (move (url_suffix)),
      retry_ (retry_policy::from (o)),
      workers_ (o.downloader_threads),
      verbosity_ (o.verbosity),
      progress_ (progress),
      cancel_ (cancel),
      rng_ (random_device {} ())
  {
  }

  void fetcher::
  enqueue (const chunk& c)
  {
    lock_guard<mutex> l (mutex_);

    auto i (states_.find (c.id));
    if (i != states_.end () &&
        (i->second == chunk_state::queued   ||
         i->second == chunk_state::fetching ||
         i->second == chunk_state::verifying))
      return;

    states_[c.id] = chunk_state::queued;
    queue_.push_back (c);
  }

  void fetcher::
  close ()
  {
    lock_guard<mutex> l (mutex_);
    closed_ = true;
  }

  void fetcher::
  start ()
  {
    for (uint16_t i (0); i != workers_; ++i)
      asio::co_spawn (ioc_, worker (), asio::detached);
  }

  chunk_state fetcher::
  state (const chunk_id& id) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (states_.find (id));
    return i != states_.end () ? i->second : chunk_state::queued;
  }

  void fetcher::
  set_state (const chunk_id& id, chunk_state s)
  {
    lock_guard<mutex> l (mutex_);
    states_[id] = s;
  }

  void fetcher::
  credit (const chunk& c, uint64_t position)
  {
    uint64_t d (0);
    {
      lock_guard<mutex> l (mutex_);

      uint64_t n (min (position, c.compressed_size));
      uint64_t& x (credited_[c.id]);

      if (n > x)
      {
        d = n - x;
        x = n;
      }
    }

    if (d != 0)
      progress_.bytes (d);
  }

  asio::awaitable<void> fetcher::
  worker ()
  {
    asio::steady_timer t (ioc_);

    for (;;)
    {
      optional<chunk> c;
      {
        lock_guard<mutex> l (mutex_);

        if (failed_ || cancel_.load ())
          co_return;

        if (!queue_.empty ())
        {
          c = move (queue_.front ());
          queue_.pop_front ();
        }
        else if (closed_)
          co_return;
      }

      if (!c)
      {
        t.expires_after (idle_poll);
        co_await t.async_wait (asio::use_awaitable);
        continue;
      }

      optional<error> e;
      try
      {
        co_await fetch (*c);
      }
      catch (const failure& f)
      {
        e = f.reason ();
      }
      catch (const fs::filesystem_error& x)
      {
        e = error::fs (x.path1 (), x.code (), x.what ());
      }
      catch (const exception& x)
      {
        e = error::internal (x.what ());
      }

      if (e)
      {
        {
          lock_guard<mutex> l (mutex_);
          failed_ = true;
        }

        if (e->kind != error_kind::cancelled && verbosity_ >= 1)
          cerr << "error: unable to fetch chunk " << c->id << ": " << *e
               << endl;

        if (on_failed)
          on_failed (*e);

        co_return;
      }

      if (on_stored)
        on_stored (c->id);
    }
  }

  asio::awaitable<void> fetcher::
  sleep (chrono::milliseconds d)
  {
    asio::steady_timer t (ioc_);
    auto end (chrono::steady_clock::now () + d);

    while (!cancel_.load ())
    {
      auto now (chrono::steady_clock::now ());
      if (now >= end)
        break;

      t.expires_after (min<chrono::steady_clock::duration> (end - now,
                                                           idle_poll));
      co_await t.async_wait (asio::use_awaitable);
    }
  }

  asio::awaitable<void> fetcher::
  fetch (const chunk& c)
  {
    if (c.encryption != chunk_encryption::none)
      throw failure (error::unsupported ("encrypted chunk " + c.id));

    for (uint32_t n (0);; ++n)
    {
      if (cancel_.load ())
        throw_cancelled ();

      set_state (c.id, chunk_state::fetching);

      optional<error> e;
      try
      {
        co_await attempt (c, n);
      }
      catch (const failure& f)
      {
        e = f.reason ();
      }

      if (!e)
      {
        set_state (c.id, chunk_state::stored);
        credit (c, c.compressed_size);

        bool first;
        {
          lock_guard<mutex> l (mutex_);
          first = stored_.insert (c.id).second;
        }

        if (first)
          progress_.chunk_done ();

        if (verbosity_ >= 3)
          cerr << "trace: stored chunk " << c.id << endl;

        co_return;
      }

      bool retry (false);

      switch (e->kind)
      {
      case error_kind::checksum_mismatch:
        {
          // Whatever we have is garbage, start over.
          //
          store_.discard_part (c.id);
          retry = true;
          break;
        }
      case error_kind::network:
        {
          retry = e->retriable;
          break;
        }
      default:
        break;
      }

      if (!retry || n + 1 >= retry_.max_attempts)
      {
        set_state (c.id, chunk_state::failed);
        throw failure (move (*e));
      }

      progress_.retry ();

      chrono::milliseconds d (
        retry_.delay (n + 1, uniform_real_distribution<double> (0, 1) (rng_)));

      if (verbosity_ >= 1)
      {
        cerr << "warning: chunk " << c.id << ": " << *e << "; retrying in "
             << d.count () << "ms";

        if (mirrors_.size () > 1)
          cerr << " from " << mirrors_.pick (n + 1).url_prefix;

        cerr << endl;
      }

      co_await sleep (d);
    }
  }

  asio::awaitable<void> fetcher::
  attempt (const chunk& c, size_t n)
  {
    string url (mirrors_.url (n, url_suffix_, c.url_suffix));
    fs::path part (store_.part_path (c.id));
    uint64_t offset (store_.part_size (c.id));

    bool zstd (c.compression == chunk_compression::zstd);

    zstd_stream_decoder dec;
    md5 raw_hash;
    md5 out_hash;
    string out;
    uint64_t received (0);
    ofstream ofs;

    auto corrupt = [&c] ()
    {
      return failure (error::checksum (checksum_scope::chunk, c.id));
    };

    zstd_stream_decoder::sink emit ([&] (const char* p, size_t k)
    {
      if (out.size () + k > c.decompressed_size)
        throw corrupt ();

      out.append (p, k);
      out_hash.update (p, k);
    });

    auto feed = [&] (const char* p, size_t k)
    {
      raw_hash.update (p, k);
      received += k;

      if (!zstd)
      {
        emit (p, k);
        return;
      }

      try
      {
        dec.decode (p, k, emit);
      }
      catch (const failure&)
      {
        throw;
      }
      catch (const runtime_error&)
      {
        throw corrupt ();
      }
    };

    http_body_sink sink;

    sink.begin = [&] (bool resumed, const string& enc)
    {
      if (!enc.empty () && enc != "identity")
        throw failure (error::unsupported ("content encoding '" + enc +
                                           "' for chunk " + c.id));

      if (resumed)
      {
        // Pick up where the previous attempt left off by replaying what it
        // got through the decoder and the hashes.
        //
        ifstream ifs (part, ios::binary);
        char buf[65536];

        while (ifs)
        {
          ifs.read (buf, sizeof (buf));
          streamsize k (ifs.gcount ());

          if (k > 0)
            feed (buf, static_cast<size_t> (k));
        }

        if (received != offset)
          throw corrupt ();

        credit (c, received);
        ofs.open (part, ios::binary | ios::app);
      }
      else
        ofs.open (part, ios::binary | ios::trunc);

      if (!ofs)
        throw_fs (part, make_error_code (errc::io_error), "unable to open");
    };

    sink.data = [&] (const char* p, size_t k)
    {
      ofs.write (p, static_cast<streamsize> (k));
      if (!ofs)
        throw_fs (part, make_error_code (errc::io_error), "write failed");

      feed (p, k);
      credit (c, received);
    };

    // A partial download as long as the object means an earlier run got
    // every byte but did not get to store the chunk. Asking for more would
    // only earn us a 416. Anything longer cannot be a prefix of the object.
    //
    bool complete (false);

    if (offset != 0 && offset >= c.compressed_size)
    {
      if (offset == c.compressed_size)
        complete = true;
      else
      {
        if (verbosity_ >= 3)
          cerr << "trace: discarding oversized partial download of chunk "
               << c.id << endl;

        store_.discard_part (c.id);
        offset = 0;
      }
    }

    if (complete)
    {
      if (verbosity_ >= 3)
        cerr << "trace: verifying complete partial download of chunk "
             << c.id << endl;

      sink.begin (true, string ());
    }
    else
    {
      if (verbosity_ >= 3)
      {
        cerr << "trace: GET " << url;
        if (offset != 0)
          cerr << " from byte " << offset;
        cerr << endl;
      }

      bool restart (false);
      try
      {
        co_await net_.fetch (url, offset, sink, "identity", &cancel_);
      }
      catch (const failure& f)
      {
        const error& e (f.reason ());

        if (offset == 0 ||
            e.kind != error_kind::network ||
            e.http_status != 416)
          throw;

        restart = true;
      }

      // The server does not have what the partial download claims to be a
      // prefix of. Start over from the first byte.
      //
      if (restart)
      {
        if (verbosity_ >= 1)
          cerr << "warning: range not satisfiable for chunk " << c.id
               << ", discarding " << offset << " downloaded bytes" << endl;

        ofs.close ();
        store_.discard_part (c.id);

        co_await attempt (c, n);
        co_return;
      }
    }

    ofs.close ();
    if (ofs.fail ())
      throw_fs (part, make_error_code (errc::io_error), "write failed");

    set_state (c.id, chunk_state::verifying);

    if (zstd && !dec.complete ())
      throw corrupt ();

    if (out.size () != c.decompressed_size || out_hash.finish () != c.id)
      throw corrupt ();

    if (!c.compressed_md5.empty () &&
        !compare_hashes (raw_hash.finish (), c.compressed_md5))
      throw corrupt ();

    store_.insert_verified (c.id, out);

    // The compressed download is of no further use.
    //
    store_.discard_part (c.id);
  }
}
