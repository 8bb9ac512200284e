#include <sophon/plan/planner.hxx>

#include <atomic>
#include <cassert>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

#include <sophon/sophon-error.hxx>
#include <sophon/hash/hash.hxx>

using namespace std;
using namespace sophon;

static void
add_file (manifest& m, const string& path, initializer_list<string> parts)
{
  file_entry f;
  f.path = path;

  string content;
  for (const string& p: parts)
  {
    chunk c;
    c.id = md5_hex (p);
    c.url_suffix = c.id;
    c.compressed_size = p.size ();
    c.decompressed_size = p.size ();

    if (m.find_chunk (c.id) == nullptr)
    {
      m.chunks.push_back (c);
      m.link ();
    }

    f.chunks.push_back (chunk_ref {c.id, content.size (), p.size ()});
    content += p;
  }

  f.size = content.size ();
  f.md5 = md5_hex (content);
  m.files.push_back (move (f));
  m.link ();
}

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "sophon-planner-test");
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static const string X ("XXXX"), Y ("YYYY"), Z ("ZZZZ"), Y2 ("yyyy");

// Compact rendering of the step sequence, e.g. "fX fY aa.bin".
//
static string
steps (const plan& p)
{
  const map<chunk_id, string> names {
    {md5_hex (X), "X"}, {md5_hex (Y), "Y"}, {md5_hex (Z), "Z"},
    {md5_hex (Y2), "Y'"}};

  auto name = [&names] (const chunk_id& id) -> string
  {
    auto i (names.find (id));
    return i != names.end () ? i->second : "?";
  };

  string r;
  for (const plan_step& s: p.steps)
  {
    if (!r.empty ())
      r += ' ';

    switch (s.kind)
    {
    case step_kind::fetch_chunk:   r += 'f' + name (s.chunk); break;
    case step_kind::extract_chunk: r += 'x' + name (s.chunk); break;
    case step_kind::assemble_file: r += 'a' + s.path; break;
    case step_kind::rename_file:   r += 'r' + s.source + '>' + s.path; break;
    case step_kind::delete_file:   r += 'd' + s.path; break;
    }
  }
  return r;
}

static void
test_fresh ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest m;
  add_file (m, "a.bin", {X, Y});
  add_file (m, "b.bin", {Z});

  plan p (make_plan (m, nullptr, d, s, plan_options ()));

  assert (p.fetches == 3 && p.assemblies == 2);
  assert (steps (p) == "fX fY aa.bin fZ ab.bin");
  assert (p.fetch_bytes == 12 && p.assemble_bytes == 12);
  assert ((p.broken == vector<string> {"a.bin", "b.bin"}));

  // Every file is reported checked, missing ones included.
  //
  d.write ("b.bin", Z);

  atomic<size_t> checked (0);
  atomic<size_t> intact (0);

  plan_options o;
  o.on_check = [&checked, &intact] (const file_entry&, file_state s)
  {
    checked++;
    if (s == file_state::intact)
      intact++;
  };

  make_plan (m, nullptr, d, s, o);
  assert (checked == 2 && intact == 1);

  fs::remove_all (r);
}

// Shared chunk is fetched once and each file follows its last fetch.
//
static void
test_shared ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest m;
  add_file (m, "a.bin", {X, Y});
  add_file (m, "b.bin", {Y, Z});
  add_file (m, "c.bin", {X, Y}); // All chunks shared.

  plan p (make_plan (m, nullptr, d, s, plan_options ()));

  assert (p.fetches == 3 && p.assemblies == 3);
  assert (steps (p) == "fX fY aa.bin ac.bin fZ ab.bin");

  fs::remove_all (r);
}

// Intact files produce nothing. Stored chunks are not fetched again, and
// files that need no fetch come first.
//
static void
test_existing ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest m;
  add_file (m, "a.bin", {X, Y});
  add_file (m, "b.bin", {Z});
  add_file (m, "empty", {});

  d.write ("b.bin", Z);
  s.insert (md5_hex (X), X);
  s.insert (md5_hex (Y), Y);

  plan p (make_plan (m, nullptr, d, s, plan_options ()));
  assert (steps (p) == "aa.bin aempty");
  assert (p.fetches == 0);

  d.write ("a.bin", X + Y);
  d.write ("empty", "");
  assert (make_plan (m, nullptr, d, s, plan_options ()).empty ());

  // Same size, different content.
  //
  d.write ("b.bin", "zzzz");
  assert (steps (make_plan (m, nullptr, d, s, plan_options ())) ==
          "fZ ab.bin");

  // Unless we trust sizes.
  //
  plan_options o;
  o.verify_existing = false;
  assert (make_plan (m, nullptr, d, s, o).empty ());

  fs::remove_all (r);
}

// Update where one chunk changes: the unchanged chunk comes out of the old
// file, a moved file is renamed, and a dropped file is deleted last.
//
static void
test_update ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest o;
  add_file (o, "a.bin", {X, Y});
  add_file (o, "old.bin", {Z});
  add_file (o, "c.bin", {X});

  manifest n;
  add_file (n, "a.bin", {X, Y2});
  add_file (n, "new.bin", {Z});

  d.write ("a.bin", X + Y);
  d.write ("old.bin", Z);
  d.write ("c.bin", X);

  plan p (make_plan (n, &o, d, s, plan_options ()));

  assert (steps (p) == "xX rold.bin>new.bin fY' aa.bin dc.bin");
  assert (p.extracts == 1 && p.fetches == 1 && p.assemblies == 1);

  const plan_step& x (p.steps[0]);
  assert (x.path == "c.bin" || x.path == "a.bin");
  assert (x.offset == 0 && x.length == 4);

  fs::remove_all (r);
}

// A rename whose source is damaged falls back to assembly and the damaged
// source is removed.
//
static void
test_broken_rename ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest o;
  add_file (o, "old.bin", {Z});

  manifest n;
  add_file (n, "new.bin", {Z});

  d.write ("old.bin", "zzz");

  plan p (make_plan (n, &o, d, s, plan_options ()));
  assert (steps (p) == "fZ anew.bin dold.bin");

  fs::remove_all (r);
}

static void
test_unresolvable ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest m;
  add_file (m, "a.bin", {X});
  m.chunks.clear ();
  m.link ();

  bool thrown (false);
  try
  {
    make_plan (m, nullptr, d, s, plan_options ());
  }
  catch (const failure& e)
  {
    thrown = e.reason ().kind == error_kind::unresolvable_chunk &&
             e.reason ().chunk == md5_hex (X);
  }
  assert (thrown);

  fs::remove_all (r);
}

// Pre-download plans carry fetches only.
//
static void
test_chunks_only ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest m;
  add_file (m, "a.bin", {X, Y});

  plan_options o;
  o.assemble = false;

  plan p (make_plan (m, nullptr, d, s, o));
  assert (steps (p) == "fX fY");

  fs::remove_all (r);
}

// Pre-downloading an update leaves the installed build alone and only
// fetches what it does not already carry.
//
static void
test_chunks_only_update ()
{
  fs::path r (scratch ());
  destination d (r);
  chunk_store s (d.chunk_dir (), true);

  manifest o;
  add_file (o, "a.bin", {X, Y});
  add_file (o, "old.bin", {Z});
  add_file (o, "gone.bin", {Y});

  manifest n;
  add_file (n, "a.bin", {X, Y2});
  add_file (n, "new.bin", {Z});

  d.write ("a.bin", X + Y);
  d.write ("old.bin", Z);
  d.write ("gone.bin", Y);

  plan_options po;
  po.assemble = false;

  plan p (make_plan (n, &o, d, s, po));

  assert (steps (p) == "fY'");
  assert (p.extracts == 0 && p.assemblies == 0);
  assert (p.fetch_bytes == Y2.size ());

  // Whereas the update itself extracts, renames and deletes.
  //
  plan u (make_plan (n, &o, d, s, plan_options ()));
  assert (u.count (step_kind::extract_chunk) == 1);
  assert (u.count (step_kind::rename_file) == 1);
  assert (u.count (step_kind::delete_file) == 1);
  assert (u.fetches == 1);

  fs::remove_all (r);
}

static void
test_verify ()
{
  fs::path r (scratch ());
  destination d (r);

  manifest m;
  add_file (m, "a.bin", {X, Y});
  add_file (m, "b.bin", {Z});
  add_file (m, "c.bin", {Z});

  d.write ("a.bin", X + Y);
  d.write ("b.bin", "zzzz");

  vector<string> bad (verify (m, d, 2));
  assert ((bad == vector<string> {"b.bin", "c.bin"}));

  fs::remove_all (r);
}

int
main ()
{
  test_fresh ();
  test_shared ();
  test_existing ();
  test_update ();
  test_broken_rename ();
  test_unresolvable ();
  test_chunks_only ();
  test_chunks_only_update ();
  test_verify ();
}
