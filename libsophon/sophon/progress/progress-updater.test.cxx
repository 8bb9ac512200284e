#include <sophon/progress/progress-updater.hxx>

#include <cassert>
#include <sstream>
#include <thread>
#include <vector>

using namespace std;
using namespace sophon;

static void
test_fold ()
{
  progress_updater u;

  progress p (u.snapshot ());
  assert (p.state == progress_state::planning);
  assert (p.done_bytes == 0 && p.total_bytes == 0);

  u.totals (100, 2, 3);
  u.state (progress_state::downloading);
  u.bytes (40);
  u.chunk_done ();
  u.retry ();

  p = u.snapshot ();
  assert (p.total_bytes == 100 && p.total_files == 2 && p.total_chunks == 3);
  assert (p.done_bytes == 40 && p.done_chunks == 1 && p.retries == 1);
  assert (p.state == progress_state::downloading);

  // Nothing new, nothing changes.
  //
  progress q (u.snapshot ());
  assert (q.done_bytes == 40 && q.state == p.state);

  u.bytes (60);
  u.state (progress_state::assembling);
  u.file_done ();
  u.file_done ();
  u.state (progress_state::done);

  p = u.snapshot ();
  assert (p.done_bytes == 100 && p.done_files == 2);
  assert (p.state == progress_state::done && p.finished ());
  assert (!p.reason);
}

// Failure is terminal and keeps the counters.
//
static void
test_failure ()
{
  progress_updater u;

  u.state (progress_state::downloading);
  u.bytes (10);
  u.broken (4);
  u.fail (error::network (false, "GET x", 404));
  u.state (progress_state::done);
  u.bytes (5);

  progress p (u.snapshot ());
  assert (p.state == progress_state::failed);
  assert (p.reason && p.reason->kind == error_kind::network);
  assert (p.reason->http_status == 404);
  assert (p.done_bytes == 15);
  assert (p.broken_files == 4);
}

// Many producers, counters add up and never go back.
//
static void
test_producers ()
{
  progress_updater u;

  const size_t threads (8);
  const size_t events (1000);

  vector<thread> ts;
  for (size_t i (0); i != threads; ++i)
  {
    ts.emplace_back ([&u] ()
    {
      for (size_t j (0); j != events; ++j)
        u.bytes (1);
    });
  }

  uint64_t last (0);
  for (size_t i (0); i != 100; ++i)
  {
    uint64_t n (u.snapshot ().done_bytes);
    assert (n >= last);
    last = n;
  }

  for (thread& t: ts)
    t.join ();

  assert (u.snapshot ().done_bytes == threads * events);
}

// Checks count up to their own total and late work grows the totals.
//
static void
test_checks ()
{
  progress_updater u;

  u.checks (3);
  u.file_checked ();
  u.file_checked ();

  progress p (u.snapshot ());
  assert (p.total_checks == 3 && p.checked_files == 2);
  assert (p.total_bytes == 0);

  u.totals (100, 1, 2);
  u.bytes (100);
  u.more (40, 1);
  u.bytes (40);

  p = u.snapshot ();
  assert (p.total_bytes == 140 && p.total_chunks == 3);
  assert (p.done_bytes <= p.total_bytes);
  assert (p.total_checks == 3);
}

static void
test_print ()
{
  ostringstream os;
  os << progress_state::planning << ' ' << progress_state::verifying << ' '
     << progress_state::failed;
  assert (os.str () == "planning verifying failed");
}

int
main ()
{
  test_fold ();
  test_failure ();
  test_producers ();
  test_checks ();
  test_print ();
}
