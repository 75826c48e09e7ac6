# define BOOST_TEST_DYN_LINK
# define BOOST_TEST_MODULE TestRenderOptions
# include <boost/test/unit_test.hpp>

# include "generator.hh"
# include "render_options.hh"
# include "utils/gravatar.hh"

# include "test_common.hh"

using Visage::Generator;
using Visage::RenderOptions;
using Visage::Gravatar;
using Visage::options_error;

BOOST_AUTO_TEST_SUITE(Options)

  BOOST_AUTO_TEST_CASE(unset_by_default)
  {
    setup ();

    RenderOptions o;

    BOOST_CHECK (!o.default_image ());
    BOOST_CHECK (!o.rating ());
    BOOST_CHECK (!o.size ());
    BOOST_CHECK (!o.force_default ());
    BOOST_CHECK (o.empty ());

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(named_values)
  {
    setup ();

    RenderOptions o;

    o.set_default (Gravatar::Default::NOT_FOUND);
    BOOST_CHECK (*o.default_image () == "404");

    o.set_default (Gravatar::Default::MYSTERY_PERSON);
    BOOST_CHECK (*o.default_image () == "mp");

    o.set_default (Gravatar::Default::BLANK);
    BOOST_CHECK (*o.default_image () == "blank");

    o.set_rating (Gravatar::Rating::G);
    BOOST_CHECK (*o.rating () == "g");

    o.set_rating (Gravatar::Rating::PG);
    BOOST_CHECK (*o.rating () == "pg");

    BOOST_CHECK (!o.empty ());

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(size_bounds)
  {
    setup ();

    RenderOptions o;

    BOOST_CHECK_NO_THROW (o.set_size (1));
    BOOST_CHECK (*o.size () == 1);

    BOOST_CHECK_NO_THROW (o.set_size (2048));
    BOOST_CHECK (*o.size () == 2048);

    BOOST_CHECK_NO_THROW (o.set_size (80));
    BOOST_CHECK (*o.size () == 80);

    BOOST_CHECK (Gravatar::valid_size (Gravatar::MIN_SIZE));
    BOOST_CHECK (Gravatar::valid_size (Gravatar::MAX_SIZE));
    BOOST_CHECK (!Gravatar::valid_size (0));
    BOOST_CHECK (!Gravatar::valid_size (2049));

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(size_rejected)
  {
    setup ();

    RenderOptions o;

    BOOST_CHECK_THROW (o.set_size (0), options_error);
    BOOST_CHECK_THROW (o.set_size (2049), options_error);
    BOOST_CHECK_THROW (o.set_size (-1), options_error);

    /* a rejected size leaves the options untouched */
    BOOST_CHECK (!o.size ());
    BOOST_CHECK (o.empty ());

    o.set_size (200);
    BOOST_CHECK_THROW (o.set_size (4096), options_error);
    BOOST_CHECK (*o.size () == 200);

    Generator g;
    BOOST_CHECK (g.generate_with_options ("a@b.c", o) == g.generate ("a@b.c") + "?size=200");

    try {
      o.set_size (0);
      BOOST_ERROR ("set_size (0) did not throw");
    } catch (const options_error &ex) {
      LOG (test) << "options_error: " << ex.what ();
      BOOST_CHECK (std::string (ex.what ()).find ("2048") != std::string::npos);
    }

    teardown ();
  }

BOOST_AUTO_TEST_SUITE_END()
