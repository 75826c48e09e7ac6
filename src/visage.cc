# include <iostream>
# include <vector>
# include <map>
# include <atomic>

/* program options */
# include <boost/program_options.hpp>
# include <boost/filesystem.hpp>

/* log */
# include <boost/log/core.hpp>
# include <boost/log/utility/setup/console.hpp>
# include <boost/log/utility/setup/common_attributes.hpp>
# include <boost/log/sources/record_ostream.hpp>
# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/log/expressions.hpp>
# include <boost/log/trivial.hpp>
# include <boost/log/support/date_time.hpp>

# include "visage.hh"
# include "build_config.hh"
# include "config.hh"
# include "generator.hh"
# include "render_options.hh"
# include "utils/gravatar.hh"
# include "utils/ustring_utils.hh"

using namespace std;
using namespace boost::filesystem;

namespace logging   = boost::log;
namespace expr      = boost::log::expressions;

/* globally available static instance of the Visage */
Visage::Visage * Visage::visage = NULL;
const char* const Visage::Visage::version = VISAGE_VERSION;

namespace Visage {
  std::atomic<bool> Visage::log_initialized (false);

  // Initialization and creation {{{
  Visage::Visage () : m_config (NULL) {
    setlocale (LC_ALL, "");
    Glib::init ();

    /* options */
    desc.add_options ()
      ( "help,h", "print this help message")
      ( "config,c", po::value<string>(), "config file, default: $XDG_CONFIG_HOME/visage/config")
      ( "new-config,n",   "make new default config, then exit")
      ( "base-url,b", po::value<string>(), "base url the hash is appended to")
      ( "host", po::value<string>(), "use https://<host>/avatar/ as base url")
      ( "default,d", po::value<string>(), "default image: 404, mp, identicon, monsterid, wavatar, retro, robohash, blank or an url")
      ( "rating,r", po::value<string>(), "maximum rating: g, pg, r or x")
      ( "size,s", po::value<int>(), "image size in pixels (1 - 2048)")
      ( "force-default,f", "always return the default image")
      ( "extension,e", "append .jpg to the hash")
      ( "hash", "only print the hash of each address")
      ( "disable-log",    "disable logging")
      ( "log-stdout",     "log to the console regardless of configuration")
      ( "email", po::value<vector<string>>(), "email address (may be repeated, read from stdin if none)");
  }

  Visage::~Visage () {
    if (m_config) delete m_config;
  }

  void Visage::init_console_log () {
    if (log_initialized.exchange (true)) return;

    /* log to console */
    logging::formatter format =
                  expr::stream
                      << "["
                      << expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%H:%M:%S")
                      << "] [" << expr::attr <boost::log::attributes::current_thread_id::value_type>("ThreadID")
                      << "] [" << logging::trivial::severity
                      << "] " << expr::smessage
              ;

    logging::add_console_log (std::clog)->set_formatter (format);
  }
  // }}}

  int Visage::run (int argc, char **argv) { // {{{
    po::variables_map vm;
    po::positional_options_description pos;
    pos.add ("email", -1);

    bool show_help = false;

    try {
      po::store ( po::command_line_parser (argc, argv).options (desc).positional (pos).run (), vm );
      po::notify (vm);
    } catch (po::error &ex) {
      cerr << "visage: " << ex.what() << endl;
      cerr << desc << endl;
      return 1;
    }

    show_help |= vm.count("help") > 0;

    if (show_help) {
      cout << desc << endl;
      return 0;
    }

    logging::add_common_attributes ();
    bool log_stdout = false;
    if (vm.count ("log-stdout")) {
      log_stdout = true;
      init_console_log ();
    }

    if (vm.count ("disable-log")) {
      logging::core::get()->set_logging_enabled (false);
    }

    /* make new config {{{ */
    if (vm.count("new-config")) {
      LOG (info) << "creating new config..";

      try {
        Config ncnf (false, true);

        if (vm.count("config")) {
          ncnf.std_paths.config_file = path(vm["config"].as<string>());
        }

        if (exists(ncnf.std_paths.config_file)) {
          LOG (error) << "the config file: " << ncnf.std_paths.config_file.c_str() << " already exists.";
          cerr << "visage: the config file: " << ncnf.std_paths.config_file.c_str() << " already exists." << endl;
          return 1;
        }

        LOG (info) << "writing default config to: " << ncnf.std_paths.config_file.c_str();
        ncnf.load_config (true);
        ncnf.write_back_config ();

      } catch (const std::exception &ex) {
        LOG (error) << "failed to write config: " << ex.what ();
        cerr << "visage: failed to write config: " << ex.what () << endl;
        return 1;
      }

      return 0;
    } // }}}

    /* load config */
    if (m_config) {
      delete m_config;
      m_config = NULL;
    }

    try {
      if (vm.count("config")) {
        m_config = new Config (vm["config"].as<string>().c_str());
      } else {
        m_config = new Config ();
      }
    } catch (const boost::property_tree::ptree_error &ex) {
      LOG (error) << "cf: failed to read config: " << ex.what ();
      cerr << "visage: failed to read config: " << ex.what () << endl;
      return 1;
    } catch (const config_error &ex) {
      LOG (error) << "cf: " << ex.what ();
      cerr << "visage: " << ex.what () << endl;
      return 1;
    }

    /* setting up loggers */
    if (config ("visage.log").get<bool>("stdout") && !log_stdout) {
      init_console_log ();
    }

    map<string, logging::trivial::severity_level> sevmap = {
      { "trace",   logging::trivial::trace },
      { "debug",   logging::trivial::debug },
      { "info",    logging::trivial::info },
      { "warning", logging::trivial::warning },
      { "error",   logging::trivial::error },
      { "fatal",   logging::trivial::fatal },
    };

    string log_level = config ("visage.log").get<string> ("level");

    /* Non existing llevel in map will be silently ignored */
    if (sevmap.count (log_level)) {
      logging::core::get()->set_filter (logging::trivial::severity >= sevmap[log_level]);
    }

    LOG (info) << "welcome to visage! - " << Visage::version;

    /* generator */
    Generator generator = m_config->generator ();

    if (vm.count ("host")) {
      generator = Generator::for_host (vm["host"].as<string>(), generator.include_file_extension ());
    }

    if (vm.count ("base-url")) {
      generator = Generator (vm["base-url"].as<string>(), generator.include_file_extension ());
    }

    if (vm.count ("extension")) {
      generator = Generator (generator.base_url (), true);
    }

    LOG (debug) << "base url: " << generator.base_url ().raw ();

    /* query options */
    RenderOptions options;
    try {
      options = m_config->render_options ();

      if (vm.count ("default")) options.set_default (vm["default"].as<string>());
      if (vm.count ("rating"))  options.set_rating (vm["rating"].as<string>());
      if (vm.count ("size"))    options.set_size (vm["size"].as<int>());
      if (vm.count ("force-default")) options.set_force_default (true);

    } catch (const options_error &ex) {
      LOG (error) << "invalid options: " << ex.what ();
      cerr << "visage: " << ex.what () << endl;
      return 1;
    } catch (const boost::property_tree::ptree_error &ex) {
      LOG (error) << "cf: bad options in config: " << ex.what ();
      cerr << "visage: bad options in config: " << ex.what () << endl;
      return 1;
    }

    /* addresses */
    vector<ustring> addresses;
    if (vm.count ("email")) {
      for (auto &e : vm["email"].as<vector<string>>()) {
        addresses.push_back (e);
      }
    } else {
      LOG (debug) << "reading addresses from stdin..";
      addresses = read_addresses (cin);
    }

    int n = print_uris (generator, options, addresses, vm.count ("hash") > 0);
    LOG (debug) << "printed " << n << " of " << addresses.size () << " addresses";

    return 0;
  } // }}}

  vector<ustring> Visage::read_addresses (istream & in) {
    vector<ustring> addresses;
    string line;

    while (getline (in, line)) {
      ustring a (line);

      if (!a.validate ()) {
        LOG (warn) << "skipping line that is not valid utf-8: " << line;
        continue;
      }

      UstringUtils::trim (a);

      if (!a.empty ()) {
        addresses.push_back (a);
      }
    }

    return addresses;
  }

  int Visage::print_uris (
      const Generator & generator,
      const RenderOptions & options,
      const vector<ustring> & addresses,
      bool hash_only)
  {
    int n = 0;

    for (auto &a : addresses) {
      if (!a.validate ()) {
        LOG (warn) << "skipping address that is not valid utf-8: " << a.raw ();
        continue;
      }

      ustring out;
      if (hash_only) {
        out = Generator::hash_email (a);
      } else {
        out = generator.generate_with_options (a, options);
      }

      LOG (debug) << "for: " << a.raw () << ", uri: " << out.raw ();
      cout << out.raw () << endl;
      n++;
    }

    return n;
  }

  const boost::property_tree::ptree& Visage::config (const std::string& id) const {
    return m_config->config.get_child(id);
  }

  const Config& Visage::get_config () const {
    return *m_config;
  }

  void Visage::main_test () { // {{{
    init_console_log ();

    m_config = new Config (true);
  } // }}}

  bool Visage::in_test () {
    return m_config->test;
  }
}
