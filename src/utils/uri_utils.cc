# include "uri_utils.hh"

namespace Visage {
  ustring UriUtils::escape_query_value (const ustring & value) {
    return Glib::uri_escape_string (value.raw (), std::string (), false);
  }
}
