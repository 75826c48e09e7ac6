# define BOOST_TEST_DYN_LINK
# define BOOST_TEST_MODULE TestGeneric
# include <boost/test/unit_test.hpp>

# include "utils/ustring_utils.hh"
# include "utils/vector_utils.hh"
# include "utils/digest.hh"
# include "utils/uri_utils.hh"

# include "test_common.hh"

BOOST_AUTO_TEST_SUITE(Generic)

  BOOST_AUTO_TEST_CASE(setup_test)
  {
    setup ();
    BOOST_CHECK (visage->in_test ());
    teardown ();
  }

  BOOST_AUTO_TEST_CASE (utils_test)
  {
    setup ();

    using namespace Visage;

    ustring a;

    /* trim_right */
    a = " a";
    UstringUtils::trim_right (a);
    BOOST_CHECK (a == " a");

    a = " aasdfasdf     ";
    UstringUtils::trim_right (a);
    BOOST_CHECK (a == " aasdfasdf");

    a = "    ";
    UstringUtils::trim_right (a);
    BOOST_CHECK (a == "");

    /* trim */
    a = "\t aasdfasdf \n";
    UstringUtils::trim (a);
    BOOST_CHECK (a == "aasdfasdf");

    a = "        ";
    UstringUtils::trim (a);
    BOOST_CHECK (a.empty ());

    a = "";
    UstringUtils::trim (a);
    BOOST_CHECK (a.empty ());

    a = "n";
    UstringUtils::trim_left (a);
    BOOST_CHECK (a == "n");

    /* inner whitespace is kept */
    a = "  a b  ";
    UstringUtils::trim (a);
    BOOST_CHECK (a == "a b");

    /* not valid utf-8: only ascii whitespace is trimmed, bytes are kept */
    a = std::string ("\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80");
    UstringUtils::trim (a);
    BOOST_CHECK (a.raw () == std::string (20, '\x80'));

    a = std::string (" \t\xff\xfe x\x80 \n");
    UstringUtils::trim (a);
    BOOST_CHECK (a.raw () == "\xff\xfe x\x80");

    /* normalize */
    BOOST_CHECK (UstringUtils::normalize_address ("  A.B@C.D ") == "a.b@c.d");
    BOOST_CHECK (UstringUtils::normalize_address ("") == "");

    /* concat */
    std::vector<ustring> v = { "a=1", "b=2", "c=3" };
    BOOST_CHECK (VectorUtils::concat (v, "&") == "a=1&b=2&c=3");

    std::vector<ustring> one = { "a=1" };
    BOOST_CHECK (VectorUtils::concat (one, "&") == "a=1");

    std::vector<ustring> none;
    BOOST_CHECK (VectorUtils::concat (none, "&") == "");

    teardown ();
  }

  BOOST_AUTO_TEST_CASE (digest_test)
  {
    setup ();

    using namespace Visage;

    BOOST_CHECK (Digest::md5_hex ("") == "d41d8cd98f00b204e9800998ecf8427e");
    BOOST_CHECK (Digest::md5_hex ("The quick brown fox jumps over the lazy dog") == "9e107d9d372bb6826bd81d3542a419d6");

    /* digest is over the input as given, no normalization */
    BOOST_CHECK (Digest::md5_hex ("A") != Digest::md5_hex ("a"));

    teardown ();
  }

  BOOST_AUTO_TEST_CASE (uri_test)
  {
    setup ();

    using namespace Visage;

    BOOST_CHECK (UriUtils::escape_query_value ("identicon") == "identicon");
    BOOST_CHECK (UriUtils::escape_query_value ("a b") == "a%20b");
    BOOST_CHECK (UriUtils::escape_query_value ("a&b=c?d#e") == "a%26b%3Dc%3Fd%23e");
    BOOST_CHECK (UriUtils::escape_query_value ("50%") == "50%25");
    BOOST_CHECK (UriUtils::escape_query_value ("") == "");

    teardown ();
  }

BOOST_AUTO_TEST_SUITE_END()
