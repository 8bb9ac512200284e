#include <sophon/progress/progress-updater.hxx>

#include <utility>

using namespace std;

namespace sophon
{
  ostream&
  operator<< (ostream& os, progress_state s)
  {
    switch (s)
    {
      case progress_state::planning:    return os << "planning";
      case progress_state::downloading: return os << "downloading";
      case progress_state::assembling:  return os << "assembling";
      case progress_state::verifying:   return os << "verifying";
      case progress_state::done:        return os << "done";
      case progress_state::failed:      return os << "failed";
    }
    return os;
  }

  void progress_updater::
  post (progress_event e)
  {
    lock_guard<mutex> l (queue_mutex_);
    queue_.push_back (move (e));
  }

  void progress_updater::
  fail (error r)
  {
    progress_event e;
    e.state = progress_state::failed;
    e.reason = move (r);
    post (move (e));
  }

  progress progress_updater::
  snapshot ()
  {
    // Take the queue as is and let the producers carry on with a fresh one
    // while we fold.
    //
    vector<progress_event> q;
    {
      lock_guard<mutex> l (queue_mutex_);
      q.swap (queue_);
    }

    lock_guard<mutex> l (state_mutex_);

    for (progress_event& e: q)
      apply (e);

    return current_;
  }

  void progress_updater::
  apply (progress_event& e)
  {
    progress& p (current_);

    if (e.totals)
    {
      p.total_bytes = e.totals->bytes;
      p.total_files = e.totals->files;
      p.total_chunks = e.totals->chunks;
    }

    if (e.checks)
      p.total_checks = *e.checks;

    p.total_bytes += e.more_bytes;
    p.total_chunks += e.more_chunks;

    p.done_bytes += e.bytes;
    p.done_files += e.files;
    p.done_chunks += e.chunks;
    p.retries += e.retries;
    p.broken_files += e.broken;
    p.checked_files += e.checked;

    if (e.state && !p.finished ())
    {
      p.state = *e.state;

      if (p.state == progress_state::failed)
        p.reason = move (e.reason);
    }
  }
}
