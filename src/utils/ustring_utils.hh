# pragma once

# include <glibmm.h>

namespace Visage {
  class UstringUtils {
    public:
      /* trimmed from strings that are not valid utf-8 */
      static const char * const ascii_space;

      /* strings that are not valid utf-8 are trimmed of ascii whitespace
       * only, byte by byte. */
      static void trim (Glib::ustring &);
      static void trim_left (Glib::ustring &);
      static void trim_right (Glib::ustring &);

      /* trimmed and lowercased, the form an address is hashed in */
      static Glib::ustring normalize_address (const Glib::ustring &);
  };
}
