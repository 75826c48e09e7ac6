# include <boost/log/core.hpp>
# include "visage.hh"

namespace logging = boost::log;

int main (int argc, char **argv) {
  Visage::visage = new Visage::Visage ();
  int r = Visage::visage->run (argc, argv);
  delete Visage::visage;
  logging::core::get()->remove_all_sinks ();
  return r;
}
