# pragma once

# include "proto.hh"

namespace Visage {
  class Digest {
    public:
      /* lowercase hex md5 of the utf-8 bytes of str */
      static ustring md5_hex (const ustring & str);
  };
}
