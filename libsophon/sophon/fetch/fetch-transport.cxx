#include <sophon/fetch/fetch-transport.hxx>

#include <filesystem>
#include <fstream>
#include <system_error>

#include <sophon/sophon-error.hxx>

using namespace std;

namespace sophon
{
  namespace fs = std::filesystem;

  http_client_traits
  make_client_traits (const options& o)
  {
    http_client_traits t;
    t.connect_timeout = o.connect_timeout;
    t.request_timeout = o.request_timeout;
    t.max_redirects = o.max_redirects;
    t.user_agent = o.user_agent;
    return t;
  }

  transport::
  transport (asio::io_context& ioc, const options& o)
    : http_ (ioc, make_client_traits (o))
  {
  }

  asio::awaitable<http_fetch_result> transport::
  fetch (const string& url,
         uint64_t offset,
         const http_body_sink& sink,
         string accept_encoding,
         const atomic<bool>* cancel)
  {
    url_parts u;
    try
    {
      u = parse_url (url);
    }
    catch (const invalid_argument& e)
    {
      throw failure (error::network (false, e.what ()));
    }

    if (u.scheme == "file")
      co_return fetch_file (u.target, offset, sink, cancel);

    if (u.scheme == "http" || u.scheme == "https")
      co_return co_await http_.fetch (url, offset, sink, accept_encoding, cancel);

    throw failure (error::unsupported ("URL scheme '" + u.scheme + "'"));
  }

  asio::awaitable<fetched_blob> transport::
  fetch_all (const string& url, const atomic<bool>* cancel)
  {
    fetched_blob r;

    http_body_sink sink;
    sink.begin = [&r] (bool, const string& e)
    {
      r.data.clear ();
      r.content_encoding = e;
    };
    sink.data = [&r] (const char* p, size_t n)
    {
      r.data.append (p, n);
    };

    co_await fetch (url, 0, sink, "gzip, br", cancel);
    co_return r;
  }

  http_fetch_result transport::
  fetch_file (const string& path,
              uint64_t offset,
              const http_body_sink& sink,
              const atomic<bool>* cancel)
  {
    fs::path p (path);

    error_code ec;
    uintmax_t size (fs::file_size (p, ec));

    if (ec)
    {
      // Same as a server that does not have it.
      //
      if (ec == errc::no_such_file_or_directory)
        throw failure (error::network (false, "file://" + path, 404, ec));

      throw failure (error::network (true, "file://" + path, 0, ec));
    }

    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw failure (error::network (true,
                                     "file://" + path,
                                     0,
                                     make_error_code (errc::io_error)));

    // Like a server, refuse a range that starts at or past the end.
    //
    if (offset != 0 && offset >= size)
      throw failure (error::network (false,
                                     "file://" + path +
                                     ": range not satisfiable",
                                     416));

    http_fetch_result r;

    if (offset != 0)
    {
      ifs.seekg (static_cast<streamoff> (offset));
      r.status = 206;
      r.resumed = true;
    }
    else
      r.status = 200;

    if (sink.begin)
      sink.begin (r.resumed, string ());

    char buf[65536];

    while (ifs)
    {
      if (cancel != nullptr && cancel->load ())
        throw_cancelled ();

      ifs.read (buf, sizeof (buf));
      streamsize n (ifs.gcount ());

      if (n > 0)
      {
        sink.data (buf, static_cast<size_t> (n));
        r.bytes += static_cast<uint64_t> (n);
      }
    }

    if (ifs.bad ())
      throw failure (error::network (true,
                                     "file://" + path,
                                     0,
                                     make_error_code (errc::io_error)));

    return r;
  }
}
