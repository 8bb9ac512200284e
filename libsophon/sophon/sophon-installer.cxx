#include <sophon/sophon-installer.hxx>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace std;

namespace sophon
{
  struct updater::state
  {
    progress_updater progress;
    atomic<bool> cancel {false};
    thread worker;
    install_result result;
  };

  updater::
  updater (unique_ptr<state> s)
    : state_ (move (s))
  {
  }

  updater::
  updater (updater&&) noexcept = default;

  updater& updater::
  operator= (updater&& x) noexcept
  {
    if (this != &x)
    {
      if (state_ != nullptr && state_->worker.joinable ())
      {
        state_->cancel.store (true);
        state_->worker.join ();
      }

      state_ = move (x.state_);
    }

    return *this;
  }

  updater::
  ~updater ()
  {
    if (state_ != nullptr && state_->worker.joinable ())
    {
      state_->cancel.store (true);
      state_->worker.join ();
    }
  }

  updater::state& updater::
  get ()
  {
    if (state_ == nullptr)
      throw logic_error ("use of moved-from updater");

    return *state_;
  }

  progress updater::
  snapshot ()
  {
    return get ().progress.snapshot ();
  }

  void updater::
  cancel ()
  {
    get ().cancel.store (true);
  }

  install_result updater::
  wait ()
  {
    state& s (get ());

    if (s.worker.joinable ())
      s.worker.join ();

    return s.result;
  }

  static updater
  start (run_mode m,
         build_source target,
         optional<build_source> previous,
         fs::path root,
         options o)
  {
    o.validate ();

    unique_ptr<updater::state> s (make_unique<updater::state> ());
    updater::state* sp (s.get ());

    sp->worker = thread (
      [sp, m,
       t = move (target),
       p = move (previous),
       r = move (root),
       o = move (o)] () mutable
      {
        uint8_t v (o.verbosity);

        try
        {
          coordinator c (m,
                         move (t),
                         move (p),
                         move (r),
                         move (o),
                         sp->progress,
                         sp->cancel);
          c.run ();

          sp->result.success = true;
          return;
        }
        catch (const failure& e)
        {
          sp->result.reason = e.reason ();
        }
        catch (const std::filesystem::filesystem_error& e)
        {
          sp->result.reason = error::fs (e.path1 (), e.code (), e.what ());
        }
        catch (const exception& e)
        {
          sp->result.reason = error::internal (e.what ());
        }

        if (sp->result.reason->kind != error_kind::cancelled && v >= 1)
          cerr << "error: " << m << " failed: " << *sp->result.reason << endl;

        sp->progress.fail (*sp->result.reason);
      });

    return updater (move (s));
  }

  updater
  install (build_source s, fs::path d, options o)
  {
    return start (run_mode::install, move (s), nullopt, move (d), move (o));
  }

  updater
  update (build_source prev, build_source s, fs::path d, options o)
  {
    return start (run_mode::update, move (s), move (prev), move (d), move (o));
  }

  updater
  repair (build_source s, fs::path d, options o)
  {
    return start (run_mode::repair, move (s), nullopt, move (d), move (o));
  }

  updater
  predownload (build_source s, fs::path d, options o)
  {
    o.keep_chunk_cache = true;
    return start (run_mode::predownload, move (s), nullopt, move (d), move (o));
  }

  updater
  predownload (build_source prev, build_source s, fs::path d, options o)
  {
    o.keep_chunk_cache = true;
    return start (run_mode::predownload,
                  move (s),
                  move (prev),
                  move (d),
                  move (o));
  }
}
