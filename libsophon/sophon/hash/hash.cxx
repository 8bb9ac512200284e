#include <sophon/hash/hash.hxx>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace sophon
{
  md5::
  md5 ()
    : ctx_ (EVP_MD_CTX_new ())
  {
    if (ctx_ == nullptr)
      throw runtime_error ("unable to allocate digest context");

    if (EVP_DigestInit_ex (ctx_, EVP_md5 (), nullptr) != 1)
    {
      EVP_MD_CTX_free (ctx_);
      throw runtime_error ("unable to initialize MD5 digest");
    }
  }

  md5::
  ~md5 ()
  {
    if (ctx_ != nullptr)
      EVP_MD_CTX_free (ctx_);
  }

  md5::
  md5 (md5&& x) noexcept
    : ctx_ (x.ctx_)
  {
    x.ctx_ = nullptr;
  }

  md5& md5::
  operator= (md5&& x) noexcept
  {
    if (this != &x)
    {
      if (ctx_ != nullptr)
        EVP_MD_CTX_free (ctx_);

      ctx_ = x.ctx_;
      x.ctx_ = nullptr;
    }

    return *this;
  }

  void md5::
  update (const void* d, size_t n)
  {
    if (n != 0 && EVP_DigestUpdate (ctx_, d, n) != 1)
      throw runtime_error ("MD5 update failed");
  }

  string md5::
  finish ()
  {
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_, h, &n) != 1)
      throw runtime_error ("MD5 finalization failed");

    // Re-arm for the next digest.
    //
    if (EVP_DigestInit_ex (ctx_, EVP_md5 (), nullptr) != 1)
      throw runtime_error ("unable to initialize MD5 digest");

    ostringstream os;
    for (unsigned int i (0); i < n; ++i)
      os << hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

    return os.str ();
  }

  string
  md5_hex (const void* d, size_t n)
  {
    md5 h;
    h.update (d, n);
    return h.finish ();
  }

  string
  md5_file (const filesystem::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      return string ();

    md5 h;
    char buf[65536];

    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
      h.update (buf, static_cast<size_t> (ifs.gcount ()));

    if (ifs.bad ())
      return string ();

    return h.finish ();
  }

  string
  md5_file_range (const filesystem::path& p, uint64_t off, uint64_t len)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      return string ();

    ifs.seekg (static_cast<streamoff> (off));
    if (!ifs)
      return string ();

    md5 h;
    char buf[65536];

    while (len != 0)
    {
      size_t n (len < sizeof (buf) ? static_cast<size_t> (len) : sizeof (buf));

      if (!ifs.read (buf, static_cast<streamsize> (n)))
        return string (); // Short file.

      h.update (buf, n);
      len -= n;
    }

    return h.finish ();
  }

  bool
  compare_hashes (string_view x, string_view y)
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  bool
  valid_md5 (string_view s)
  {
    if (s.size () != 32)
      return false;

    for (char c: s)
    {
      if (!isxdigit (static_cast<unsigned char> (c)))
        return false;
    }

    return true;
  }
}
