#include <sophon/hash/hash.hxx>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using namespace std;
using namespace sophon;

namespace fs = std::filesystem;

// Well-known RFC 1321 vectors.
//
static void
test_vectors ()
{
  assert (md5_hex ("") == "d41d8cd98f00b204e9800998ecf8427e");
  assert (md5_hex ("a") == "0cc175b9c0f1b6a831c399e269772661");
  assert (md5_hex ("abc") == "900150983cd24fb0d6963f7d28e17f72");
  assert (md5_hex ("message digest") == "f96b697d7cb7938d525a2f31aaf161d0");
}

// Feeding the input in pieces must give the same digest, and the object
// must be reusable after finish().
//
static void
test_incremental ()
{
  md5 h;
  h.update ("mess");
  h.update ("age ");
  h.update ("digest");
  assert (h.finish () == "f96b697d7cb7938d525a2f31aaf161d0");

  h.update ("abc");
  assert (h.finish () == "900150983cd24fb0d6963f7d28e17f72");

  md5 m (std::move (h));
  m.update ("a");
  assert (m.finish () == "0cc175b9c0f1b6a831c399e269772661");
}

static void
test_files ()
{
  fs::path d (fs::temp_directory_path () / "sophon-hash-test");
  fs::remove_all (d);
  fs::create_directories (d);

  fs::path f (d / "f");
  {
    ofstream ofs (f, ios::binary);
    ofs << "xxabcyy";
  }

  assert (md5_file (f) == md5_hex ("xxabcyy"));
  assert (md5_file_range (f, 2, 3) == md5_hex ("abc"));
  assert (md5_file_range (f, 0, 0) == md5_hex (""));

  // Range past the end and missing files yield nothing.
  //
  assert (md5_file_range (f, 5, 3).empty ());
  assert (md5_file (d / "missing").empty ());

  fs::remove_all (d);
}

static void
test_compare ()
{
  assert (compare_hashes ("ABCdef", "abcDEF"));
  assert (!compare_hashes ("abc", "abcd"));
  assert (!compare_hashes ("abc", "abd"));

  assert (valid_md5 ("d41d8cd98f00b204e9800998ecf8427e"));
  assert (valid_md5 ("D41D8CD98F00B204E9800998ECF8427E"));
  assert (!valid_md5 ("d41d8cd98f00b204e9800998ecf8427"));
  assert (!valid_md5 ("z41d8cd98f00b204e9800998ecf8427e"));
}

int
main ()
{
  test_vectors ();
  test_incremental ();
  test_files ();
  test_compare ();
}
