#include <sophon/sophon-error.hxx>

#include <sstream>
#include <utility>

using namespace std;

namespace sophon
{
  ostream&
  operator<< (ostream& os, error_kind k)
  {
    switch (k)
    {
      case error_kind::malformed_manifest: return os << "malformed manifest";
      case error_kind::unresolvable_chunk: return os << "unresolvable chunk";
      case error_kind::network:            return os << "network error";
      case error_kind::checksum_mismatch:  return os << "checksum mismatch";
      case error_kind::filesystem:         return os << "filesystem error";
      case error_kind::cancelled:          return os << "cancelled";
      case error_kind::no_space:           return os << "not enough space";
      case error_kind::unsupported:        return os << "unsupported";
      case error_kind::internal:           return os << "internal error";
    }
    return os;
  }

  error error::
  malformed (string d)
  {
    error e;
    e.kind = error_kind::malformed_manifest;
    e.detail = move (d);
    return e;
  }

  error error::
  unresolvable (string c)
  {
    error e;
    e.kind = error_kind::unresolvable_chunk;
    e.chunk = move (c);
    return e;
  }

  error error::
  network (bool r, string d, uint16_t s, error_code ec)
  {
    error e;
    e.kind = error_kind::network;
    e.retriable = r;
    e.detail = move (d);
    e.http_status = s;
    e.system_error = ec;
    return e;
  }

  error error::
  checksum (checksum_scope s, string c, filesystem::path p)
  {
    error e;
    e.kind = error_kind::checksum_mismatch;
    e.scope = s;
    e.chunk = move (c);
    e.path = move (p);
    return e;
  }

  error error::
  fs (filesystem::path p, error_code ec, string d)
  {
    error e;
    e.kind = error_kind::filesystem;
    e.path = move (p);
    e.system_error = ec;
    e.detail = move (d);
    return e;
  }

  error error::
  cancel ()
  {
    error e;
    e.kind = error_kind::cancelled;
    return e;
  }

  error error::
  no_space (uint64_t r, uint64_t a)
  {
    error e;
    e.kind = error_kind::no_space;
    e.required = r;
    e.available = a;
    return e;
  }

  error error::
  unsupported (string d)
  {
    error e;
    e.kind = error_kind::unsupported;
    e.detail = move (d);
    return e;
  }

  error error::
  internal (string d)
  {
    error e;
    e.kind = error_kind::internal;
    e.detail = move (d);
    return e;
  }

  string
  to_string (const error& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  ostream&
  operator<< (ostream& os, const error& e)
  {
    os << e.kind;

    switch (e.kind)
    {
    case error_kind::network:
      {
        os << (e.retriable ? " (retriable)" : " (fatal)");

        if (e.http_status != 0)
          os << ": HTTP " << e.http_status;

        break;
      }
    case error_kind::checksum_mismatch:
      {
        if (e.scope)
          os << " (" << *e.scope << ')';
        break;
      }
    case error_kind::no_space:
      {
        os << ": " << e.required << " bytes required, "
           << e.available << " available";
        break;
      }
    default:
      break;
    }

    if (!e.chunk.empty ())
      os << ": chunk " << e.chunk;

    if (!e.path.empty ())
      os << ": " << e.path.string ();

    if (!e.detail.empty ())
      os << ": " << e.detail;

    if (e.system_error)
      os << ": " << e.system_error.message ();

    return os;
  }

  failure::
  failure (error e)
    : runtime_error (to_string (e)),
      error_ (move (e))
  {
  }

  void
  throw_malformed (string d)
  {
    throw failure (error::malformed (move (d)));
  }

  void
  throw_fs (const filesystem::path& p, error_code ec, string d)
  {
    throw failure (error::fs (p, ec, move (d)));
  }

  void
  throw_cancelled ()
  {
    throw failure (error::cancel ());
  }
}
