# pragma once

# include "proto.hh"

namespace Visage {
  class UriUtils {
    public:
      /* percent-encode everything except the unreserved characters of
       * RFC 3986, non-ascii characters are encoded byte by byte. */
      static ustring escape_query_value (const ustring &);
  };
}
