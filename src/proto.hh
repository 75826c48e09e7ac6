# pragma once

# include <glibmm.h>

/* forward declarations of classes and structs 'n stuff */
namespace Visage {

  /* aliases for often used types  */
  typedef Glib::ustring ustring;
  typedef Glib::ustring::size_type ustring_sz;

  /* core */
  class Visage;
  class Config;
  struct StandardPaths;

  /* url generation */
  class Generator;
  class RenderOptions;
  class Gravatar;

}
