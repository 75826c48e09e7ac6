# include "gravatar.hh"

# include "proto.hh"

using namespace std;

namespace Visage {

  const int Gravatar::MIN_SIZE;
  const int Gravatar::MAX_SIZE;

  const char * const Gravatar::BASE_URL            = "https://www.gravatar.com/avatar/";
  const char * const Gravatar::LIBRAVATAR_BASE_URL = "https://cdn.libravatar.org/avatar/";

  vector<ustring> Gravatar::DefaultStr = {
    "404",
    "mp",
    "identicon",
    "monsterid",
    "wavatar",
    "retro",
    "robohash",
    "blank",
  };

  vector<ustring> Gravatar::RatingStr = {
    "g",
    "pg",
    "r",
    "x",
  };

  bool Gravatar::valid_size (int size) {
    return (size >= MIN_SIZE && size <= MAX_SIZE);
  }
}
