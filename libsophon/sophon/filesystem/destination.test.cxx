#include <sophon/filesystem/destination.hxx>

#include <cassert>
#include <string>

#include <sophon/sophon-error.hxx>

using namespace std;
using namespace sophon;

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "sophon-destination-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static void
test_basics ()
{
  fs::path r (scratch ());
  destination d (r);

  assert (!d.exists ("a/b.bin"));
  assert (!d.size ("a/b.bin"));

  d.write ("a/b.bin", "hello");
  assert (d.exists ("a/b.bin"));
  assert (*d.size ("a/b.bin") == 5);
  assert (d.read ("a/b.bin") == "hello");

  // Directories have no size.
  //
  assert (!d.size ("a"));

  d.rename ("a/b.bin", "c/d/e.bin");
  assert (!d.exists ("a/b.bin"));
  assert (d.read ("c/d/e.bin") == "hello");

  d.create_dir_all ("x/y");
  d.write ("x/2", "");
  d.write ("x/1", "");

  vector<string> ls (d.list_dir ("x"));
  assert ((ls == vector<string> {"1", "2", "y"}));

  d.remove ("x/1");
  d.remove ("x/1"); // Missing is fine.
  assert (!d.exists ("x/1"));

  assert (d.available () > 0);

  bool thrown (false);
  try
  {
    d.read ("missing");
  }
  catch (const failure& e)
  {
    thrown = e.reason ().kind == error_kind::filesystem;
  }
  assert (thrown);

  fs::remove_all (r);
}

// Read-only targets are replaced and removed.
//
static void
test_read_only ()
{
  fs::path r (scratch ());
  destination d (r);

  d.write ("ro.bin", "old");
  fs::permissions (d.path ("ro.bin"),
                   fs::perms::owner_write |
                   fs::perms::group_write |
                   fs::perms::others_write,
                   fs::perm_options::remove);

  d.write ("ro.bin", "new");
  assert (d.read ("ro.bin") == "new");

  fs::permissions (d.path ("ro.bin"),
                   fs::perms::owner_write,
                   fs::perm_options::remove);
  d.remove ("ro.bin");
  assert (!d.exists ("ro.bin"));

  fs::remove_all (r);
}

// Free space is reported for a root that does not exist yet.
//
static void
test_fresh_root ()
{
  fs::path r (scratch () / "not" / "yet");
  destination d (r);

  assert (d.available () > 0);

  fs::remove_all (r.parent_path ().parent_path ());
}

int
main ()
{
  test_basics ();
  test_read_only ();
  test_fresh_root ();
}
