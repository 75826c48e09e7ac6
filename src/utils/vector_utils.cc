# include <vector>
# include <algorithm>

# include "vector_utils.hh"

using namespace std;

namespace Visage {
  ustring VectorUtils::concat (const vector<ustring> & strs, const ustring & delim) {
    bool first = true;
    ustring out;

    for_each (strs.begin (),
              strs.end (),
              [&](const ustring & a) {
                if (!first) {
                  out += delim;
                } else {
                  first = false;
                }

                out += a;
              });

    return out;
  }
}
