# include "render_options.hh"

using namespace std;

namespace Visage {
  RenderOptions & RenderOptions::set_default (const ustring & d) {
    m_default = d;
    return *this;
  }

  RenderOptions & RenderOptions::set_default (Gravatar::Default d) {
    return set_default (Gravatar::DefaultStr[d]);
  }

  RenderOptions & RenderOptions::set_rating (const ustring & r) {
    m_rating = r;
    return *this;
  }

  RenderOptions & RenderOptions::set_rating (Gravatar::Rating r) {
    return set_rating (Gravatar::RatingStr[r]);
  }

  RenderOptions & RenderOptions::set_size (int s) {
    if (!Gravatar::valid_size (s)) {
      ustring e = ustring::compose ("size must be between %1 and %2, got: %3",
          Gravatar::MIN_SIZE, Gravatar::MAX_SIZE, s);

      throw options_error (e.c_str ());
    }

    m_size = s;
    return *this;
  }

  RenderOptions & RenderOptions::set_force_default (bool f) {
    m_force_default = f;
    return *this;
  }

  const boost::optional<ustring> & RenderOptions::default_image () const {
    return m_default;
  }

  const boost::optional<ustring> & RenderOptions::rating () const {
    return m_rating;
  }

  const boost::optional<int> & RenderOptions::size () const {
    return m_size;
  }

  const boost::optional<bool> & RenderOptions::force_default () const {
    return m_force_default;
  }

  bool RenderOptions::empty () const {
    return !m_default && !m_rating && !m_size && !(m_force_default && *m_force_default);
  }

  options_error::options_error (const char * w) : runtime_error (w)
  {
  }
}
