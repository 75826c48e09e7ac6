# include <iostream>
# include <stdlib.h>
# include <functional>
# include <vector>

# include <boost/filesystem.hpp>
# include <boost/filesystem/operations.hpp>
# include <boost/property_tree/ptree.hpp>
# include <boost/property_tree/json_parser.hpp>

# include "config.hh"
# include "generator.hh"
# include "render_options.hh"
# include "utils/gravatar.hh"

using namespace std;
using namespace boost::filesystem;
using boost::property_tree::ptree;

namespace Visage {
  Config::Config (bool _test, bool no_load) {
    if (_test) {
      LOG (info) << "cf: loading test config.";
    }

    test = _test;

    load_dirs ();

    if (std_paths.config_dir.empty ()) {
      LOG (error) << "cf: cannot locate config directory.";
      throw config_error ("cannot locate config directory: HOME is not set");
    }

    std_paths.config_file = std_paths.config_dir / path("config");

    if (!no_load)
      load_config ();
  }

  Config::Config (const char * fname, bool no_load) {
    test = false;

    load_dirs ();
    std_paths.config_file = path(fname);
    LOG (info) << "cf: loading config: " << fname;
    if (!no_load)
      load_config (); // re-sets config_dir to parent of fname
  }

  void Config::load_dirs () {
    if (test) {
      /* the test config never touches the file system */
      std_paths.home       = current_path ();
      std_paths.config_dir = std_paths.home;
      return;
    }

    char * home_c = getenv ("HOME");
    char * config_home = getenv ("XDG_CONFIG_HOME");

    if (home_c != NULL) {
      std_paths.home = path(home_c);
      LOG (debug) << "cf: HOME: " << home_c;
    }

    if (config_home != NULL) {
      std_paths.config_dir = path(config_home) / path("visage");
    } else if (home_c != NULL) {
      std_paths.config_dir = std_paths.home / path(".config/visage");
    } else {
      LOG (warn) << "cf: neither HOME nor XDG_CONFIG_HOME is set.";
    }
  }

  ptree Config::setup_default_config () {
    ptree default_config;
    default_config.put ("visage.config.version", CONFIG_VERSION);

    /* log */
    default_config.put ("visage.log.level", "warning");
    default_config.put ("visage.log.stdout", false);

    /* generator */
    default_config.put ("generator.base_url", Gravatar::BASE_URL);
    default_config.put ("generator.file_extension", false);

    /* query options, empty or 0 means not sent */
    default_config.put ("options.default", "");
    default_config.put ("options.rating", "");
    default_config.put ("options.size", 0);
    default_config.put ("options.force_default", false);

    return default_config;
  }

  void Config::write_back_config () {
    LOG (warn) << "cf: writing back config to: " << std_paths.config_file;

    bfs::path dir = std_paths.config_file.parent_path ();
    if (!dir.empty () && !is_directory (dir)) {
      LOG (warn) << "cf: making config dir..";
      create_directories (dir);
    }

    write_json (std_paths.config_file.c_str (), config);
  }

  void Config::load_config (bool initial) {
    if (test) {
      LOG (info) << "cf: test config, loading defaults.";
      config = setup_default_config ();
      config.put ("visage.log.level", "trace");
      return;
    }

    LOG (info) << "cf: loading: " << std_paths.config_file;

    std_paths.config_dir = absolute(std_paths.config_file.parent_path());

    if (!is_regular_file (std_paths.config_file)) {
      if (!initial) {
        LOG (warn) << "cf: no config, using defaults.";
      }
      config = setup_default_config ();
    } else {

      /* loading config file */
      ptree new_config;
      config = setup_default_config ();
      read_json (std_paths.config_file.c_str(), new_config);

      merge_ptree (new_config);

      if (!check_config (new_config)) {
        LOG (info) << "cf: values missing from the config file are taken from the defaults";
      }

      LOG (info) << "cf: version: " << config.get<int>("visage.config.version");
    }
  }

  bool Config::check_config (ptree new_config) {
    LOG (debug) << "cf: check config..";

    /* values are merged in as strings, make sure the typed ones convert */
    static const vector<string> int_keys  = {
      "visage.config.version",
      "options.size",
    };
    static const vector<string> bool_keys = {
      "visage.log.stdout",
      "generator.file_extension",
      "options.force_default",
    };

    try {
      for (auto &k : int_keys)  config.get<int> (k);
      for (auto &k : bool_keys) config.get<bool> (k);
    } catch (const boost::property_tree::ptree_bad_data &ex) {
      LOG (error) << "cf: bad value in config: " << ex.what ();

      ustring e = ustring::compose ("bad value in config file %1: %2",
          std_paths.config_file.string (), ex.what ());
      throw config_error (e.c_str ());
    }

    int version = config.get<int>("visage.config.version");

    if (version < CONFIG_VERSION) {
      LOG (error) << "cf: the config file is an old version (" << version << "), the current version is: " << CONFIG_VERSION;
    }

    /* default keys the file does not set */
    int missing = 0;
    traverse (setup_default_config (),
        [&] (const ptree &, const ptree::path_type & p, const ptree & child) {
          if (child.empty () && !p.empty () && !new_config.get_child_optional (p)) {
            LOG (debug) << "cf: not in config file: " << p.dump ();
            missing++;
          }
        });

    return (missing == 0);
  }

  Generator Config::generator () const {
    return Generator (
        config.get<string> ("generator.base_url"),
        config.get<bool> ("generator.file_extension"));
  }

  RenderOptions Config::render_options () const {
    RenderOptions opts;

    string d = config.get<string> ("options.default");
    if (!d.empty ()) opts.set_default (d);

    string r = config.get<string> ("options.rating");
    if (!r.empty ()) opts.set_rating (r);

    int s = config.get<int> ("options.size");
    if (s != 0) opts.set_size (s);

    if (config.get<bool> ("options.force_default")) opts.set_force_default (true);

    return opts;
  }

  // from http://stackoverflow.com/questions/8154107/how-do-i-merge-update-a-boostproperty-treeptree
  template<typename T>
    void Config::traverse_recursive(
        const boost::property_tree::ptree &parent,
        const boost::property_tree::ptree::path_type &childPath,
        const boost::property_tree::ptree &child, T &method)
    {
      using boost::property_tree::ptree;

      method(parent, childPath, child);
      for(ptree::const_iterator it=child.begin();
          it!=child.end();
          ++it) {
        ptree::path_type curPath = childPath / ptree::path_type(it->first);
        traverse_recursive(parent, curPath, it->second, method);
      }
    }

  void Config::traverse(const ptree &parent,
            function<void(const ptree &,
            const ptree::path_type &,
            const ptree&)> method)
    {
      traverse_recursive(parent, "", parent, method);
    }

  void Config::merge(const ptree & /* parent */,
             const ptree::path_type &childPath,
             const ptree &child) {

    // overwrites existing default values
    config.put(childPath, child.data());
  }

  void Config::merge_ptree(const ptree &pt)   {
    using namespace std::placeholders;

    function<void(const ptree &,
      const ptree::path_type &,
      const ptree&)> method = bind (&Config::merge, this, _1, _2, _3);

    traverse(pt, method);
  }

  config_error::config_error (const char * w) : runtime_error (w)
  {
  }
}
