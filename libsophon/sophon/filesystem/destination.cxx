#include <sophon/filesystem/destination.hxx>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

#ifdef _WIN32
#  include <io.h>
#  include <fcntl.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

#include <sophon/sophon-error.hxx>

using namespace std;

namespace sophon
{
  destination::
  destination (fs::path r)
    : root_ (move (r))
  {
  }

  bool destination::
  exists (const string& rel) const
  {
    error_code ec;
    return fs::exists (path (rel), ec);
  }

  optional<uint64_t> destination::
  size (const string& rel) const
  {
    error_code ec;
    fs::path p (path (rel));

    if (!fs::is_regular_file (p, ec))
      return nullopt;

    uintmax_t n (fs::file_size (p, ec));
    if (ec)
      return nullopt;

    return static_cast<uint64_t> (n);
  }

  string destination::
  read (const string& rel) const
  {
    fs::path p (path (rel));
    ifstream ifs (p, ios::binary);

    if (!ifs)
      throw_fs (p, make_error_code (errc::no_such_file_or_directory),
                "unable to open for reading");

    string r ((istreambuf_iterator<char> (ifs)), istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw_fs (p, make_error_code (errc::io_error), "read failed");

    return r;
  }

  void destination::
  write (const string& rel, string_view d)
  {
    fs::path p (path (rel));

    if (p.has_parent_path ())
    {
      error_code ec;
      fs::create_directories (p.parent_path (), ec);
      if (ec)
        throw_fs (p.parent_path (), ec, "unable to create directory");
    }

    make_writable (p);

    {
      ofstream ofs (p, ios::binary | ios::trunc);
      if (!ofs)
        throw_fs (p, make_error_code (errc::permission_denied),
                  "unable to open for writing");

      ofs.write (d.data (), static_cast<streamsize> (d.size ()));

      if (!ofs.flush ())
        throw_fs (p, make_error_code (errc::io_error), "write failed");
    }

    sync_file (p);
  }

  void destination::
  rename (const string& from, const string& to)
  {
    install (path (from), to);
  }

  void destination::
  install (const fs::path& from, const string& to)
  {
    fs::path t (path (to));
    error_code ec;

    if (t.has_parent_path ())
    {
      fs::create_directories (t.parent_path (), ec);
      if (ec)
        throw_fs (t.parent_path (), ec, "unable to create directory");
    }

    make_writable (t);

    fs::rename (from, t, ec);
    if (ec)
      throw_fs (t, ec, "unable to move " + from.string () + " into place");
  }

  void destination::
  create_dir_all (const string& rel)
  {
    error_code ec;
    fs::create_directories (path (rel), ec);
    if (ec)
      throw_fs (path (rel), ec, "unable to create directory");
  }

  void destination::
  remove (const string& rel)
  {
    fs::path p (path (rel));
    make_writable (p);

    error_code ec;
    fs::remove (p, ec);
    if (ec)
      throw_fs (p, ec, "unable to remove");
  }

  vector<string> destination::
  list_dir (const string& rel) const
  {
    fs::path p (rel.empty () ? root_ : path (rel));
    vector<string> r;

    error_code ec;
    for (fs::directory_iterator i (p, ec), e; !ec && i != e; i.increment (ec))
      r.push_back (i->path ().filename ().string ());

    if (ec)
      throw_fs (p, ec, "unable to list directory");

    sort (r.begin (), r.end ());
    return r;
  }

  uint64_t destination::
  available () const
  {
    // The root may not exist yet on a fresh install so look at the closest
    // existing ancestor.
    //
    fs::path p (fs::absolute (root_));
    error_code ec;

    while (!fs::exists (p, ec) && p.has_parent_path () && p != p.parent_path ())
      p = p.parent_path ();

    fs::space_info s (fs::space (p, ec));
    if (ec)
      throw_fs (p, ec, "unable to query free space");

    return static_cast<uint64_t> (s.available);
  }

  void
  make_writable (const fs::path& p)
  {
    error_code ec;
    fs::file_status s (fs::status (p, ec));

    if (ec || !fs::is_regular_file (s))
      return;

    if ((s.permissions () & fs::perms::owner_write) == fs::perms::none)
    {
      fs::permissions (p, fs::perms::owner_write, fs::perm_options::add, ec);
      if (ec)
        throw_fs (p, ec, "unable to make writable");
    }
  }

  void
  sync_file (const fs::path& p)
  {
#ifdef _WIN32
    int fd (_wopen (p.c_str (), _O_RDWR | _O_BINARY));
    if (fd == -1)
      throw_fs (p, error_code (errno, generic_category ()), "unable to open");

    int r (_commit (fd));
    int e (errno);
    _close (fd);
#else
    int fd (::open (p.c_str (), O_RDONLY));
    if (fd == -1)
      throw_fs (p, error_code (errno, generic_category ()), "unable to open");

    int r (::fsync (fd));
    int e (errno);
    ::close (fd);
#endif

    if (r != 0)
      throw_fs (p, error_code (e, generic_category ()), "unable to sync");
  }
}
