# pragma once

# include <vector>
# include <string>
# include <atomic>
# include <istream>

# include <boost/property_tree/ptree.hpp>
# include <boost/program_options.hpp>
# include <boost/log/trivial.hpp>

# define LOG(x) BOOST_LOG_TRIVIAL(x)
# define warn warning

# include <glibmm.h>

# include "proto.hh"

namespace po = boost::program_options;

namespace Visage {
  class Visage {
    public:
      Visage ();
      ~Visage ();

      int run (int, char**);
      void main_test ();

      const boost::property_tree::ptree& config (const std::string& path=std::string()) const;
      const Config& get_config () const;
      bool  in_test ();

      static const char* const version;

    protected:
      Config * m_config;

    private:
      void init_console_log ();

      /* one url (or hash) per address, addresses with invalid utf-8 are
       * skipped. returns the number of printed lines. */
      int print_uris (const Generator &, const RenderOptions &,
                      const std::vector<ustring> &, bool hash_only);

      static std::vector<ustring> read_addresses (std::istream &);

      static std::atomic<bool> log_initialized;
      po::options_description desc;
  };

  /* globally available instance of the Visage-class */
  extern Visage * visage;
}
