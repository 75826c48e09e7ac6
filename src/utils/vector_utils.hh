# pragma once

# include "proto.hh"
# include <vector>

namespace Visage {
  class VectorUtils {
    public:
      static ustring concat (const std::vector<ustring> &, const ustring & delim);
  };
}
