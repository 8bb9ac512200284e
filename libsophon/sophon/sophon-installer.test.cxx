#include <sophon/sophon-installer.hxx>

#include <cassert>
#include <chrono>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zstd.h>

#include <sophon/hash/hash.hxx>
#include <sophon/manifest/manifest-decoder.hxx>
#include <sophon/plan/planner.hxx>

using namespace std;
using namespace sophon;

static const fs::path root (fs::temp_directory_path () / "sophon-installer-test");

static fs::path
scratch (const string& name)
{
  fs::path d (root / name);
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
compress (const string& s)
{
  string r (ZSTD_compressBound (s.size ()), '\0');
  size_t n (ZSTD_compress (r.data (), r.size (), s.data (), s.size (), 3));
  assert (!ZSTD_isError (n));
  r.resize (n);
  return r;
}

static void
put (const fs::path& p, const string& data)
{
  fs::create_directories (p.parent_path ());
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs.write (data.data (), static_cast<streamsize> (data.size ()));
  assert (ofs.good ());
}

static string
slurp (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string ((istreambuf_iterator<char> (ifs)), istreambuf_iterator<char> ());
}

static string
file_url (const fs::path& p)
{
  return "file://" + p.generic_string ();
}

// Game files of a destination (without .chunks/ and .staging/) and their
// content.
//
static map<string, string>
tree (const fs::path& d)
{
  map<string, string> r;

  for (auto i (fs::recursive_directory_iterator (d));
       i != fs::recursive_directory_iterator ();
       ++i)
  {
    string n (i->path ().filename ().string ());

    if (i->is_directory () && (n == ".chunks" || n == ".staging"))
    {
      i.disable_recursion_pending ();
      continue;
    }

    if (i->is_regular_file ())
      r.emplace (fs::relative (i->path (), d).generic_string (),
                 slurp (i->path ()));
  }

  return r;
}

using file_spec = pair<string, vector<string>>;

struct build
{
  build_source source;
  manifest m;
};

// Local CDN serving zstd-compressed chunks and manifests.
//
struct cdn
{
  fs::path dir;

  explicit
  cdn (fs::path d)
      : dir (move (d))
  {
    fs::create_directories (dir / "chunks");
    fs::create_directories (dir / "manifests");
  }

  fs::path
  chunk_path (const string& content) const
  {
    return dir / "chunks" / (md5_hex (content) + "_" +
                             to_string (content.size ()));
  }

  build
  publish (const string& id,
           const vector<file_spec>& files,
           bool zstd_manifest = false)
  {
    manifest m;

    for (const file_spec& spec: files)
    {
      file_entry f;
      f.path = spec.first;

      string content;
      for (const string& p: spec.second)
      {
        string z (compress (p));

        chunk c;
        c.id = md5_hex (p);
        c.url_suffix = c.id + "_" + to_string (p.size ());
        c.compressed_size = z.size ();
        c.decompressed_size = p.size ();
        c.compression = chunk_compression::zstd;
        c.compressed_md5 = md5_hex (z);

        if (m.find_chunk (c.id) == nullptr)
        {
          m.chunks.push_back (c);
          m.link ();
        }

        put (dir / "chunks" / c.url_suffix, z);

        f.chunks.push_back (chunk_ref {c.id, content.size (), p.size ()});
        content += p;
      }

      f.size = content.size ();
      f.md5 = md5_hex (content);
      m.files.push_back (move (f));
      m.link ();
    }

    string blob (encode_manifest (m));
    if (zstd_manifest)
      blob = compress (blob);

    put (dir / "manifests" / id, blob);

    build b;
    b.source.id = id;
    b.source.tag = "1.0";
    b.source.build_id = id;
    b.source.manifest_url = file_url (dir / "manifests" / id);
    b.source.manifest_checksum = md5_hex (blob);
    b.source.manifest_zstd = zstd_manifest;
    b.source.chunk_download.compression = 1;
    b.source.chunk_download.url_prefix = file_url (dir);
    b.source.chunk_download.url_suffix = "/chunks";

    b.m = decode_manifest (encode_manifest (m), chunk_compression::zstd);
    b.m.id = id;
    return b;
  }
};

static options
quick ()
{
  options o;
  o.downloader_threads = 4;
  o.verbosity = 0;
  o.backoff_base = chrono::milliseconds (1);
  o.backoff_cap = chrono::milliseconds (2);
  return o;
}

struct outcome
{
  install_result result;
  progress last;
};

static outcome
finish (updater u)
{
  outcome r;
  r.result = u.wait ();
  r.last = u.snapshot ();
  return r;
}

static void
check_installed (const fs::path& d, const manifest& m)
{
  for (const file_entry& f: m.files)
  {
    fs::path p (d / f.path);
    assert (fs::is_regular_file (p));
    assert (fs::file_size (p) == f.size);
    assert (md5_file (p) == f.md5);
  }
}

static const string X ("XXXXXX");
static const string Y ("YYYY");
static const string Z ("ZZZZZZ");

// S1 and idempotence.
//
static void
test_fresh_install ()
{
  fs::path d (scratch ("s1"));
  cdn c (d / "cdn");
  build b (c.publish ("m1", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  outcome o (finish (install (b.source, dst, quick ())));
  assert (o.result.success && !o.result.reason);
  assert (o.last.state == progress_state::done);
  assert (o.last.total_chunks == 3 && o.last.done_chunks == 3);
  assert (o.last.total_files == 2 && o.last.done_files == 2);
  assert (o.last.done_bytes == o.last.total_bytes);
  assert (o.last.retries == 0);

  check_installed (dst, b.m);
  assert (slurp (dst / "a.bin") == X + Y);
  assert (slurp (dst / "b.bin") == Z);

  assert (!fs::exists (dst / ".chunks"));
  assert (!fs::exists (dst / ".staging"));

  // A second run finds nothing to do.
  //
  map<string, string> before (tree (dst));

  o = finish (install (b.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 0 && o.last.done_chunks == 0);
  assert (o.last.total_files == 0);
  assert (tree (dst) == before);
}

// S2 shared chunk, zero-byte file and a zstd-wrapped manifest.
//
static void
test_shared_chunk ()
{
  fs::path d (scratch ("s2"));
  cdn c (d / "cdn");
  build b (c.publish ("m2",
                      {{"a.bin", {X, Y}},
                       {"dir/b.bin", {Y, Z}},
                       {"empty.txt", {}}},
                      true));

  fs::path dst (d / "game");

  outcome o (finish (install (b.source, dst, quick ())));
  assert (o.result.success);
  assert (o.last.done_chunks == 3);
  assert (o.last.done_files == 3);

  check_installed (dst, b.m);
  assert (fs::file_size (dst / "empty.txt") == 0);
}

// S3 corrupt chunk on the preferred mirror.
//
static void
test_corrupt_chunk ()
{
  fs::path d (scratch ("s3"));
  cdn good (d / "good");
  build b (good.publish ("m3", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  cdn bad (d / "bad");
  put (bad.chunk_path (X), compress (X));
  put (bad.chunk_path (Y), compress ("QQQQ"));
  put (bad.chunk_path (Z), compress (Z));

  build_source s (b.source);
  s.chunk_download.url_prefix = file_url (bad.dir);
  s.mirrors.push_back (cdn_mirror {file_url (good.dir), 1});

  fs::path dst (d / "game");

  outcome o (finish (install (s, dst, quick ())));
  assert (o.result.success);
  assert (o.last.state == progress_state::done);
  assert (o.last.retries == 1);
  assert (o.last.done_chunks == 3);

  check_installed (dst, b.m);
}

// S4 resume with chunks fetched by an earlier, interrupted run.
//
static void
test_resume ()
{
  fs::path d (scratch ("s4"));
  cdn c (d / "cdn");
  build b (c.publish ("m4", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  {
    chunk_store s (dst / ".chunks", false);
    s.insert (md5_hex (X), X);
    s.insert (md5_hex (Y), Y);
  }

  // Leftover of an interrupted assembly.
  //
  put (dst / ".staging" / "stale", "XXX");

  outcome o (finish (install (b.source, dst, quick ())));
  assert (o.result.success);
  assert (o.last.total_chunks == 1 && o.last.done_chunks == 1);
  assert (o.last.done_files == 2);

  check_installed (dst, b.m);
  assert (!fs::exists (dst / ".staging"));
}

// S5 diff, with equivalence to a fresh install of the new build.
//
static void
test_diff ()
{
  fs::path d (scratch ("s5"));
  cdn c (d / "cdn");

  const string Y2 ("yyyyyyyy");

  build v1 (c.publish ("v1", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));
  build v2 (c.publish ("v2", {{"a.bin", {X, Y2}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  outcome o (finish (install (v1.source, dst, quick ())));
  assert (o.result.success);

  // X comes out of the installed a.bin.
  //
  fs::remove (c.chunk_path (X));

  o = finish (update (v1.source, v2.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 1 && o.last.done_chunks == 1);
  assert (o.last.done_files == 1);

  check_installed (dst, v2.m);

  fs::path fresh (d / "fresh");
  put (c.chunk_path (X), compress (X));

  o = finish (install (v2.source, fresh, quick ()));
  assert (o.result.success);
  assert (tree (fresh) == tree (dst));

  // An old file that no longer carries the chunk it should. X is fetched
  // after all and counted in the totals.
  //
  fs::path damaged (d / "damaged");

  o = finish (install (v1.source, damaged, quick ()));
  assert (o.result.success);

  put (damaged / "a.bin", string (X.size (), 'Q') + Y);

  o = finish (update (v1.source, v2.source, damaged, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 2 && o.last.done_chunks == 2);
  assert (o.last.done_bytes == o.last.total_bytes);

  check_installed (damaged, v2.m);
}

// S6 deletion and renames.
//
static void
test_deletion ()
{
  fs::path d (scratch ("s6"));
  cdn c (d / "cdn");

  build v1 (c.publish ("v1", {{"a.bin", {X, Y}},
                              {"c.bin", {Z}},
                              {"old/name.bin", {"moved content"}}}));

  build v2 (c.publish ("v2", {{"a.bin", {X, Y}},
                              {"new/name.bin", {"moved content"}}}));

  fs::path dst (d / "game");

  outcome o (finish (install (v1.source, dst, quick ())));
  assert (o.result.success);
  assert (fs::exists (dst / "c.bin"));

  o = finish (update (v1.source, v2.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 0);

  assert (!fs::exists (dst / "c.bin"));
  assert (!fs::exists (dst / "old/name.bin"));
  check_installed (dst, v2.m);
  assert (tree (dst).size () == 2);
}

static void
test_repair_verify ()
{
  fs::path d (scratch ("repair"));
  cdn c (d / "cdn");
  build b (c.publish ("m", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  outcome o (finish (install (b.source, dst, quick ())));
  assert (o.result.success);

  destination dest (dst);
  assert (verify (b.m, dest, 2).empty ());

  // Same size, different content.
  //
  put (dst / "b.bin", "zzzzzz");
  assert (verify (b.m, dest, 2) == vector<string> {"b.bin"});

  // Trusting sizes, an install would not notice.
  //
  options t (quick ());
  t.verify_existing = false;
  o = finish (install (b.source, dst, t));
  assert (o.result.success && o.last.total_files == 0);

  o = finish (repair (b.source, dst, t));
  assert (o.result.success);
  assert (o.last.broken_files == 1);
  assert (o.last.done_chunks == 1);
  assert (o.last.done_files == 1);
  assert (o.last.total_checks == 2 && o.last.checked_files == 2);

  check_installed (dst, b.m);
  assert (verify (b.m, dest, 2).empty ());
}

static void
test_predownload ()
{
  fs::path d (scratch ("predownload"));
  cdn c (d / "cdn");
  build b (c.publish ("m", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  outcome o (finish (predownload (b.source, dst, quick ())));
  assert (o.result.success);
  assert (o.last.done_chunks == 3 && o.last.done_files == 0);

  assert (!fs::exists (dst / "a.bin"));
  assert (fs::exists (dst / ".chunks" / md5_hex (X)));
  assert (fs::exists (dst / ".chunks" / md5_hex (Y)));
  assert (fs::exists (dst / ".chunks" / md5_hex (Z)));

  // The CDN is no longer needed.
  //
  fs::remove_all (c.dir / "chunks");

  o = finish (install (b.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 0 && o.last.done_files == 2);

  check_installed (dst, b.m);
  assert (!fs::exists (dst / ".chunks"));
}

// Pre-download of an update fetches only what the installed build does not
// already carry and leaves the installed files alone.
//
static void
test_predownload_update ()
{
  fs::path d (scratch ("predownload-update"));
  cdn c (d / "cdn");

  const string Y2 ("yyyyyyyy");

  build v1 (c.publish ("v1", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));
  build v2 (c.publish ("v2", {{"a.bin", {X, Y2}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  outcome o (finish (install (v1.source, dst, quick ())));
  assert (o.result.success);

  map<string, string> before (tree (dst));

  o = finish (predownload (v1.source, v2.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 1 && o.last.done_chunks == 1);
  assert (o.last.done_files == 0);

  assert (fs::exists (dst / ".chunks" / md5_hex (Y2)));
  assert (!fs::exists (dst / ".chunks" / md5_hex (X)));
  assert (tree (dst) == before);

  // The update then needs nothing from the CDN but the manifests.
  //
  fs::remove_all (c.dir / "chunks");

  o = finish (update (v1.source, v2.source, dst, quick ()));
  assert (o.result.success);
  assert (o.last.total_chunks == 0);

  check_installed (dst, v2.m);
}

static void
test_moved ()
{
  fs::path d (scratch ("moved"));
  cdn c (d / "cdn");
  build b (c.publish ("m", {{"a.bin", {X}}}));

  updater u (install (b.source, d / "game", quick ()));
  updater v (move (u));

  bool thrown (false);
  try
  {
    u.snapshot ();
  }
  catch (const logic_error&)
  {
    thrown = true;
  }
  assert (thrown);

  assert (v.wait ().success);
}

static void
test_keep_cache ()
{
  fs::path d (scratch ("keep"));
  cdn c (d / "cdn");
  build b (c.publish ("m", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  fs::path dst (d / "game");

  options t (quick ());
  t.keep_chunk_cache = true;

  outcome o (finish (install (b.source, dst, t)));
  assert (o.result.success);
  assert (fs::exists (dst / ".chunks" / md5_hex (Z)));
  assert (!fs::exists (dst / ".staging"));
}

static error_kind
failure_kind (const build_source& s, const fs::path& dst)
{
  outcome o (finish (install (s, dst, quick ())));
  assert (!o.result.success && o.result.reason);
  assert (o.last.state == progress_state::failed);
  assert (o.last.reason && o.last.reason->kind == o.result.reason->kind);
  return o.result.reason->kind;
}

static void
test_failures ()
{
  fs::path d (scratch ("failures"));
  cdn c (d / "cdn");
  build b (c.publish ("m", {{"a.bin", {X, Y}}, {"b.bin", {Z}}}));

  {
    build_source s (b.source);
    s.manifest_checksum = md5_hex ("something else");
    assert (failure_kind (s, d / "g1") == error_kind::malformed_manifest);
  }

  {
    build_source s (b.source);
    s.stats = manifest_stats {0, 16, 3, 3};
    assert (failure_kind (s, d / "g2") == error_kind::malformed_manifest);

    s.stats = manifest_stats {0, 16, 2, 3};
    outcome o (finish (install (s, d / "g2", quick ())));
    assert (o.result.success);
  }

  {
    build_source s (b.source);
    s.chunk_download.encryption = 1;
    s.chunk_download.password = "secret";
    assert (failure_kind (s, d / "g3") == error_kind::unsupported);
  }

  {
    build_source s (b.source);
    s.manifest_url = file_url (c.dir / "manifests" / "missing");
    assert (failure_kind (s, d / "g4") == error_kind::network);
  }

  // A chunk the CDN lost. What was fetched stays for the next run.
  //
  {
    fs::remove (c.chunk_path (Z));

    outcome o (finish (install (b.source, d / "g5", quick ())));
    assert (!o.result.success);
    assert (o.result.reason->kind == error_kind::network);
    assert (o.result.reason->http_status == 404);
    assert (fs::exists (d / "g5" / ".chunks"));
    assert (!fs::exists (d / "g5" / "b.bin"));
  }

  bool thrown (false);
  try
  {
    options t;
    t.downloader_threads = 0;
    install (b.source, d / "g6", t);
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

// Whenever the cancellation lands, nothing wrong reaches a final path.
//
static void
test_cancel ()
{
  fs::path d (scratch ("cancel"));
  cdn c (d / "cdn");

  vector<file_spec> files;
  for (size_t i (0); i != 32; ++i)
  {
    string s (to_string (i));
    files.push_back ({"f" + s + ".bin",
                      {string (4096, static_cast<char> ('a' + i % 26)) + s,
                       Y}});
  }

  build b (c.publish ("m", files));
  fs::path dst (d / "game");

  updater u (install (b.source, dst, quick ()));
  u.cancel ();

  install_result r (u.wait ());

  if (!r.success)
  {
    assert (r.reason->kind == error_kind::cancelled);
    assert (u.snapshot ().state == progress_state::failed);
  }

  for (const file_entry& f: b.m.files)
  {
    fs::path p (dst / f.path);
    if (fs::exists (p))
      assert (md5_file (p) == f.md5);
  }

  // The next run completes.
  //
  outcome o (finish (install (b.source, dst, quick ())));
  assert (o.result.success);
  check_installed (dst, b.m);
}

int
main ()
{
  test_fresh_install ();
  test_shared_chunk ();
  test_corrupt_chunk ();
  test_resume ();
  test_diff ();
  test_deletion ();
  test_repair_verify ();
  test_predownload ();
  test_predownload_update ();
  test_keep_cache ();
  test_failures ();
  test_cancel ();
  test_moved ();

  fs::remove_all (root);
}
