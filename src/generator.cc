# include <vector>

# include "generator.hh"
# include "utils/gravatar.hh"
# include "utils/digest.hh"
# include "utils/uri_utils.hh"
# include "utils/ustring_utils.hh"
# include "utils/vector_utils.hh"

using namespace std;

namespace Visage {
  Generator::Generator () :
    m_base_url (Gravatar::BASE_URL),
    m_include_file_extension (false)
  {
  }

  Generator::Generator (const ustring & base_url, bool include_file_extension) :
    m_base_url (base_url),
    m_include_file_extension (include_file_extension)
  {
  }

  Generator Generator::for_host (const ustring & host, bool include_file_extension) {
    return Generator (ustring::compose ("https://%1/avatar/", host), include_file_extension);
  }

  const ustring & Generator::base_url () const {
    return m_base_url;
  }

  bool Generator::include_file_extension () const {
    return m_include_file_extension;
  }

  ustring Generator::normalize (const ustring & email) {
    return UstringUtils::normalize_address (email);
  }

  ustring Generator::hash_email (const ustring & email) {
    return Digest::md5_hex (normalize (email));
  }

  ustring Generator::generate (const ustring & email) const {
    ustring uri = m_base_url + hash_email (email);

    if (m_include_file_extension) {
      uri += ".jpg";
    }

    return uri;
  }

  ustring Generator::generate_with_options (
      const ustring & email,
      const RenderOptions & options) const
  {
    return generate (email) + query_parameters (options);
  }

  ustring Generator::query_parameters (const RenderOptions & options) {
    vector<ustring> params;

    if (options.default_image ()) {
      params.push_back ("default=" + UriUtils::escape_query_value (*options.default_image ()));
    }

    if (options.rating ()) {
      params.push_back ("rating=" + UriUtils::escape_query_value (*options.rating ()));
    }

    if (options.size ()) {
      params.push_back ("size=" + std::to_string (*options.size ()));
    }

    if (options.force_default () && *options.force_default ()) {
      params.push_back ("forcedefault=y");
    }

    if (params.empty ()) return "";

    return "?" + VectorUtils::concat (params, "&");
  }
}
