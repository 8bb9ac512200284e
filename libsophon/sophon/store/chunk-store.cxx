#include <sophon/store/chunk-store.hxx>

#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <sophon/sophon-error.hxx>
#include <sophon/hash/hash.hxx>
#include <sophon/filesystem/destination.hxx>

using namespace std;

namespace sophon
{
  chunk_store::
  chunk_store (fs::path d, bool e)
    : dir_ (move (d)), evict_ (e)
  {
    error_code ec;
    fs::create_directories (dir_, ec);
    if (ec)
      throw_fs (dir_, ec, "unable to create chunk store");
  }

  bool chunk_store::
  probe (const chunk_id& id) const
  {
    error_code ec;
    return fs::is_regular_file (chunk_path (id), ec);
  }

  void chunk_store::
  insert (const chunk_id& id, string_view b)
  {
    if (md5_hex (b) != id)
      throw failure (error::checksum (checksum_scope::chunk, id));

    commit (id, b);
  }

  void chunk_store::
  insert_verified (const chunk_id& id, string_view b)
  {
    commit (id, b);
  }

  void chunk_store::
  commit (const chunk_id& id, string_view b)
  {
    // Become the only writer of this id.
    //
    {
      unique_lock<mutex> l (insert_mutex_);
      insert_cv_.wait (l, [this, &id] {return inserting_.count (id) == 0;});

      if (probe (id))
        return;

      inserting_.insert (id);
    }

    struct guard
    {
      chunk_store& s;
      const chunk_id& id;

      ~guard ()
      {
        {
          lock_guard<mutex> l (s.insert_mutex_);
          s.inserting_.erase (id);
        }
        s.insert_cv_.notify_all ();
      }
    } g {*this, id};

    // Not the .part file: that one holds compressed bytes a later fetch may
    // want to resume from.
    //
    boost::uuids::random_generator gen;
    fs::path p (temp_path (id, boost::uuids::to_string (gen ())));

    struct temp
    {
      const fs::path& p;
      bool active = true;

      ~temp ()
      {
        if (active)
        {
          error_code ec;
          fs::remove (p, ec);
        }
      }
    } t {p};

    {
      ofstream ofs (p, ios::binary | ios::trunc);
      if (!ofs)
        throw_fs (p, make_error_code (errc::io_error), "unable to create");

      ofs.write (b.data (), static_cast<streamsize> (b.size ()));

      if (!ofs.flush ())
        throw_fs (p, make_error_code (errc::io_error), "write failed");
    }

    sync_file (p);

    error_code ec;
    fs::rename (p, chunk_path (id), ec);
    if (ec)
      throw_fs (chunk_path (id), ec, "unable to store chunk");

    t.active = false;
  }

  optional<ifstream> chunk_store::
  open_read (const chunk_id& id) const
  {
    ifstream ifs (chunk_path (id), ios::binary);

    if (!ifs)
      return nullopt;

    return optional<ifstream> (move (ifs));
  }

  uint64_t chunk_store::
  part_size (const chunk_id& id) const
  {
    error_code ec;
    uintmax_t n (fs::file_size (part_path (id), ec));
    return ec ? 0 : static_cast<uint64_t> (n);
  }

  void chunk_store::
  discard_part (const chunk_id& id)
  {
    error_code ec;
    fs::remove (part_path (id), ec);
    if (ec)
      throw_fs (part_path (id), ec, "unable to remove partial download");
  }

  bool chunk_store::
  verify (const chunk_id& id)
  {
    string h (md5_file (chunk_path (id)));

    if (h.empty ())
      return false;

    if (h != id)
    {
      evict (id);
      return false;
    }

    return true;
  }

  void chunk_store::
  retain (const chunk_id& id, uint32_t n)
  {
    lock_guard<mutex> l (refs_mutex_);
    refs_[id] += n;
  }

  bool chunk_store::
  release (const chunk_id& id)
  {
    {
      lock_guard<mutex> l (refs_mutex_);

      auto i (refs_.find (id));
      if (i == refs_.end () || i->second == 0)
        return false;

      if (--i->second != 0)
        return false;

      refs_.erase (i);
    }

    if (!evict_)
      return false;

    evict (id);
    return true;
  }

  uint32_t chunk_store::
  references (const chunk_id& id) const
  {
    lock_guard<mutex> l (refs_mutex_);

    auto i (refs_.find (id));
    return i != refs_.end () ? i->second : 0;
  }

  void chunk_store::
  evict (const chunk_id& id)
  {
    error_code ec;
    fs::remove (chunk_path (id), ec);
    if (ec)
      throw_fs (chunk_path (id), ec, "unable to evict chunk");
  }

  void chunk_store::
  remove_all ()
  {
    error_code ec;
    fs::remove_all (dir_, ec);
    if (ec)
      throw_fs (dir_, ec, "unable to remove chunk store");
  }
}
