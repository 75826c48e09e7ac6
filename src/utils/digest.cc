# include "digest.hh"

namespace Visage {
  ustring Digest::md5_hex (const ustring & str) {
    std::string cs = Glib::Checksum::compute_checksum (Glib::Checksum::ChecksumType::CHECKSUM_MD5, str.raw ());

    return cs;
  }
}
