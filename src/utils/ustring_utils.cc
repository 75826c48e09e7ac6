# include <string>

# include "proto.hh"
# include "ustring_utils.hh"

using namespace std;

namespace Visage {
  const char * const UstringUtils::ascii_space = " \t\n\v\f\r";

  // from https://github.com/markoa/gtkmm-utils/blob/master/glibmm-utils/ustring.cc
  void UstringUtils::trim_left (ustring & str)
  {
    if (str.empty ()) return;

    /* the iterators need valid utf-8 */
    if (!str.validate ()) {
      string s = str.raw ();
      s.erase (0, s.find_first_not_of (ascii_space));
      str = s;
      return;
    }

    ustring::iterator it  (str.begin ());
    ustring::iterator end (str.end ());

    for ( ; it != end; ++it)
      if (!g_unichar_isspace (*it))
        break;

    if (it == end)
      str.clear ();
    else
      str.erase (str.begin (), it);
  }

  void UstringUtils::trim_right (ustring & str)
  {
    if (str.empty ()) return;

    if (!str.validate ()) {
      string s = str.raw ();
      s.erase (s.find_last_not_of (ascii_space) + 1);
      str = s;
      return;
    }

    ustring::reverse_iterator rit  (str.rbegin ());
    ustring::reverse_iterator rend (str.rend ());

    for ( ; rit != rend; ++rit)
      if (!g_unichar_isspace (*rit))
        break;

    if (rit == rend)
      str.clear ();
    else
      str.erase (rit.base (), str.end ());
  }

  void UstringUtils::trim (ustring & str)
  {
    trim_left (str);
    trim_right (str);
  }

  ustring UstringUtils::normalize_address (const ustring & address) {
    ustring a = address;
    trim (a);

    if (a.validate ()) {
      return a.lowercase ();
    } else {
      /* lowercase the ascii bytes, leave the rest as is */
      string s = a.raw ();
      for (auto & c : s) c = Glib::Ascii::tolower (c);

      return s;
    }
  }
}
