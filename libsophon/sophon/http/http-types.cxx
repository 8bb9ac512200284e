#include <sophon/http/http-types.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace sophon
{
  // Note that we are doing this by hand to avoid pulling in a URI library.
  // It handles the scheme://host:port/path form the CDNs use but not IPv6
  // literals or user info.
  //
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    for (char& c: r.scheme)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    // file:///abs/path or file://localhost/abs/path.
    //
    if (r.scheme == "file")
    {
      string rest (url.substr (pos));

      if (rest.compare (0, 9, "localhost") == 0)
        rest.erase (0, 9);

      if (rest.empty ())
        throw invalid_argument ("empty file URL path");

      r.target = move (rest);
      return r;
    }

    size_t end (url.find_first_of ("/?", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.scheme == "https" ? "443" : "80";
    }

    if (r.host.empty ())
      throw invalid_argument ("no host in URL " + url);

    if (end < url.size ())
    {
      r.target = url.substr (end);
      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));

    string origin (b.scheme + "://" + b.host);

    bool def ((b.scheme == "https" && b.port == "443") ||
              (b.scheme == "http" && b.port == "80"));
    if (!def)
      origin += ':' + b.port;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    string t (b.target.substr (0, b.target.find ('?')));
    return origin + t.substr (0, t.rfind ('/') + 1) + loc;
  }

  status_class
  classify_status (unsigned s)
  {
    if (s >= 200 && s < 300)
      return status_class::success;

    if (s >= 300 && s < 400)
      return status_class::redirect;

    if (s == 408 || s == 429 || s >= 500)
      return status_class::retriable;

    if (s >= 400)
      return status_class::fatal;

    return status_class::retriable;
  }
}
