# pragma once

# include <stdexcept>

# include <boost/optional.hpp>

# include "proto.hh"
# include "utils/gravatar.hh"

namespace Visage {
  /* query parameters understood by the avatar service, every field is unset
   * until a setter is called. */
  class RenderOptions {
    public:
      RenderOptions & set_default (const ustring &);
      RenderOptions & set_default (Gravatar::Default);

      RenderOptions & set_rating (const ustring &);
      RenderOptions & set_rating (Gravatar::Rating);

      /* throws options_error outside Gravatar::MIN_SIZE to MAX_SIZE */
      RenderOptions & set_size (int);

      RenderOptions & set_force_default (bool);

      const boost::optional<ustring> & default_image () const;
      const boost::optional<ustring> & rating () const;
      const boost::optional<int>     & size () const;
      const boost::optional<bool>    & force_default () const;

      /* true if no query parameter would be produced */
      bool empty () const;

    private:
      boost::optional<ustring> m_default;
      boost::optional<ustring> m_rating;
      boost::optional<int>     m_size;
      boost::optional<bool>    m_force_default;
  };

  /* exceptions */
  class options_error : public std::runtime_error {
    public:
      options_error (const char *);

  };
}
