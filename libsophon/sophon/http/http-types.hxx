#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace sophon
{
  // URL parts.
  //
  // For file URLs the host is empty and the target is the local path.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Parse scheme://host[:port]/target. A URL without a scheme is taken to be
  // http. Throw std::invalid_argument if there is no host (other than for
  // file URLs).
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a redirect Location against the URL it came from. Absolute URLs
  // are returned as is, absolute paths replace the target, anything else
  // replaces the last path segment.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // What to do with a response status.
  //
  enum class status_class
  {
    success,
    redirect,
    retriable,
    fatal
  };

  inline std::ostream&
  operator<< (std::ostream& os, status_class c)
  {
    switch (c)
    {
      case status_class::success:   return os << "success";
      case status_class::redirect:  return os << "redirect";
      case status_class::retriable: return os << "retriable";
      case status_class::fatal:     return os << "fatal";
    }
    return os;
  }

  // 2xx is success and 3xx a redirect. 408, 429 and 5xx are worth retrying
  // while any other 4xx is fatal.
  //
  status_class
  classify_status (unsigned status);

  // Value of the Range header requesting everything from offset on.
  //
  inline std::string
  range_header (std::uint64_t offset)
  {
    return "bytes=" + std::to_string (offset) + '-';
  }
}
