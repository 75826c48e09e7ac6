# pragma once

# include "proto.hh"
# include <vector>

namespace Visage {
  class Gravatar {
    public:
      static const int MIN_SIZE = 1;
      static const int MAX_SIZE = 2048;

      static const char * const BASE_URL;
      static const char * const LIBRAVATAR_BASE_URL;

      /* built-in images used when no avatar is registered for a hash */
      enum Default {
        NOT_FOUND,
        MYSTERY_PERSON,
        IDENTICON,
        MONSTER_ID,
        WAVATAR,
        RETRO,
        ROBOHASH,
        BLANK,
      };

      enum Rating {
        G,
        PG,
        R,
        X,
      };

      static std::vector<ustring> DefaultStr;
      static std::vector<ustring> RatingStr;

      static bool valid_size (int);
  };
}
