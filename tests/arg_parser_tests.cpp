#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"}, {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser switch does not consume positional") {
    const char* argv[] = {"prog", "--ssh", "extra"};
    ArgParser parser(3, const_cast<char**>(argv), {"--ssh"}, {});
    REQUIRE(parser.has_flag("--ssh"));
    REQUIRE(parser.get_option("--ssh").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"extra"});
}

TEST_CASE("ArgParser short options map to long names") {
    const char* argv[] = {"prog", "-h", "-w", "4"};
    ArgParser parser(4, const_cast<char**>(argv), {"--help", "--workers"}, {"--workers"},
                     {{'h', "--help"}, {'w', "--workers"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--workers") == "4");
}

TEST_CASE("ArgParser negative number is a value") {
    const char* argv[] = {"prog", "--workers", "-3"};
    ArgParser parser(3, const_cast<char**>(argv), {"--workers"}, {"--workers"});
    REQUIRE(parser.get_option("--workers") == "-3");
    REQUIRE(parser.unknown_flags().empty());
}

TEST_CASE("ArgParser value flag without value") {
    const char* argv[] = {"prog", "--dest", "--ssh"};
    ArgParser parser(3, const_cast<char**>(argv), {"--dest", "--ssh"}, {"--dest"});
    REQUIRE(parser.has_flag("--ssh"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--dest"});
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-x");
}
