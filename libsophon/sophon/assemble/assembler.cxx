#include <sophon/assemble/assembler.hxx>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <system_error>
#include <unordered_set>

#include <boost/asio/post.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <sophon/hash/hash.hxx>

using namespace std;

namespace sophon
{
  assembler::
  assembler (destination& d,
             chunk_store& s,
             const options& o,
             progress_updater& p,
             atomic<bool>& cancel)
    : dest_ (d),
      store_ (s),
      verbosity_ (o.verbosity),
      progress_ (p),
      cancel_ (cancel),
      pool_ (o.assemblers ())
  {
  }

  assembler::
  ~assembler ()
  {
    pool_.join ();
  }

  void assembler::
  join ()
  {
    pool_.join ();
  }

  void assembler::
  submit (const file_entry& f)
  {
    asio::post (pool_, [this, &f] ()
    {
      // Queued before a cancellation or a failure elsewhere. Whoever set
      // the flag reports it.
      //
      if (cancel_.load ())
        return;

      try
      {
        vector<chunk_id> bad (assemble (f));

        if (bad.empty ())
        {
          progress_.file_done ();

          if (on_done)
            on_done (f);
        }
        else if (on_refetch)
          on_refetch (f, move (bad));
      }
      catch (const failure& e)
      {
        if (e.reason ().kind != error_kind::cancelled && verbosity_ >= 1)
          cerr << "error: unable to assemble " << f.path << ": "
               << e.reason () << endl;

        if (on_failed)
          on_failed (e.reason ());
      }
      catch (const fs::filesystem_error& e)
      {
        if (verbosity_ >= 1)
          cerr << "error: unable to assemble " << f.path << ": " << e.what ()
               << endl;

        if (on_failed)
          on_failed (error::fs (e.path1 (), e.code (), e.what ()));
      }
      catch (const exception& e)
      {
        if (verbosity_ >= 1)
          cerr << "error: unable to assemble " << f.path << ": " << e.what ()
               << endl;

        if (on_failed)
          on_failed (error::internal (e.what ()));
      }
    });
  }

  vector<chunk_id> assembler::
  assemble (const file_entry& f)
  {
    fs::path dir (dest_.staging_dir ());

    error_code ec;
    fs::create_directories (dir, ec);
    if (ec)
      throw_fs (dir, ec, "unable to create staging directory");

    // The generator is not thread-safe, so one per call.
    //
    boost::uuids::random_generator gen;
    fs::path sp (dir / boost::uuids::to_string (gen ()));

    struct staging
    {
      fs::path path;
      bool armed = true;

      ~staging ()
      {
        if (armed)
        {
          error_code ec;
          fs::remove (path, ec);
        }
      }
    } g {sp};

    md5 h;
    uint64_t written (0);
    vector<chunk_id> bad;

    {
      ofstream ofs (sp, ios::binary | ios::trunc);
      if (!ofs)
        throw_fs (sp, make_error_code (errc::io_error), "unable to create");

      char buf[65536];

      for (const chunk_ref& r: f.chunks)
      {
        if (cancel_.load ())
          throw_cancelled ();

        // Once something is wrong we only collect the rest of the missing
        // chunks.
        //
        if (!bad.empty ())
        {
          if (!store_.probe (r.id))
            bad.push_back (r.id);

          continue;
        }

        optional<ifstream> in (store_.open_read (r.id));
        if (!in)
        {
          bad.push_back (r.id);
          continue;
        }

        uint64_t left (r.length);

        while (left != 0)
        {
          in->read (buf,
                    static_cast<streamsize> (
                      min<uint64_t> (left, sizeof (buf))));

          streamsize k (in->gcount ());
          if (k <= 0)
            break;

          ofs.write (buf, k);
          h.update (buf, static_cast<size_t> (k));

          left -= static_cast<uint64_t> (k);
          written += static_cast<uint64_t> (k);
        }

        // Truncated chunk.
        //
        if (left != 0)
        {
          in.reset ();
          store_.evict (r.id);
          bad.push_back (r.id);
        }
      }

      if (!ofs.flush ())
        throw_fs (sp, make_error_code (errc::io_error), "write failed");
    }

    if (!bad.empty ())
    {
      sort (bad.begin (), bad.end ());
      bad.erase (unique (bad.begin (), bad.end ()), bad.end ());
      return bad;
    }

    sync_file (sp);

    unordered_set<chunk_id> ids;
    for (const chunk_ref& r: f.chunks)
      ids.insert (r.id);

    if (written != f.size || !compare_hashes (h.finish (), f.md5))
    {
      // Find out which chunks went bad since they were stored.
      //
      for (const chunk_id& id: ids)
      {
        if (!store_.verify (id))
          bad.push_back (id);
      }

      if (bad.empty ())
        throw failure (error::checksum (checksum_scope::file, {}, f.path));

      if (verbosity_ >= 1)
        cerr << "warning: " << f.path << " does not match its checksum, "
             << bad.size () << " chunk(s) damaged" << endl;

      sort (bad.begin (), bad.end ());
      return bad;
    }

    dest_.install (sp, f.path);
    g.armed = false;

    for (const chunk_id& id: ids)
    {
      if (store_.release (id) && verbosity_ >= 3)
        cerr << "trace: evicted chunk " << id << endl;
    }

    if (verbosity_ >= 2)
      cerr << "info: installed " << f.path << endl;

    return {};
  }
}
