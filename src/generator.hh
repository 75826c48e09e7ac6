# pragma once

# include "proto.hh"
# include "render_options.hh"

namespace Visage {
  /* Builds avatar image urls from email addresses:
   *
   *   <base_url><md5 of normalized address>[.jpg][?query]
   *
   * A Generator does not change after construction, one instance can be
   * shared by any number of threads.
   */
  class Generator {
    public:
      Generator ();
      Generator (const ustring & base_url, bool include_file_extension = false);

      /* uses https://<host>/avatar/ as base url */
      static Generator for_host (const ustring & host, bool include_file_extension = false);

      ustring generate (const ustring & email) const;
      ustring generate_with_options (const ustring & email, const RenderOptions &) const;

      const ustring & base_url () const;
      bool include_file_extension () const;

      static ustring normalize (const ustring & email);
      static ustring hash_email (const ustring & email);

      /* returns "?default=..&rating=..&size=..&forcedefault=y" with the
       * present options in that order, or an empty string. */
      static ustring query_parameters (const RenderOptions &);

    private:
      ustring m_base_url;
      bool    m_include_file_extension;
  };
}
