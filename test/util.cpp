#define BOOST_TEST_MODULE mkwl_util_test

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/util.hpp"

namespace {
    struct temp_file {
        explicit temp_file(const std::string &contents)
            : path(std::filesystem::temp_directory_path() /
                   ("mkwl_util_test_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".json")) {
            std::ofstream f(path);
            f << contents;
        }
        ~temp_file() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        std::filesystem::path path;
    };
}

BOOST_AUTO_TEST_SUITE(mkwl_util_test_suite)

BOOST_AUTO_TEST_CASE(json_from_file_reads_config) {
    temp_file f(R"({"merkle": {"hasher": "blake2b"}, "checks": ["a@mail.com"]})");
    auto config = util::json_from_file(f.path.string());

    BOOST_CHECK_EQUAL(util::config_value<std::string>(config, "merkle", "hasher", "sha256"), "blake2b");
    BOOST_CHECK(util::config_entry<std::vector<std::string>>(config, "checks", {}) ==
                std::vector<std::string>{"a@mail.com"});
}

BOOST_AUTO_TEST_CASE(json_from_file_missing_file) {
    auto missing = std::filesystem::temp_directory_path() / "mkwl_util_test_does_not_exist.json";
    BOOST_CHECK_THROW(util::json_from_file(missing.string()), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(json_from_file_parse_error) {
    temp_file f(R"({"merkle": {"hasher": )");
    BOOST_CHECK_THROW(util::json_from_file(f.path.string()), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(config_value_defaults_when_absent) {
    auto config = json::parse(R"({"merkle": {}})");
    BOOST_CHECK_EQUAL(util::config_value<std::string>(config, "merkle", "hasher", "sha256"), "sha256");
    BOOST_CHECK_EQUAL(util::config_value<bool>(config, "output", "print_tree", true), true);
    BOOST_CHECK(util::config_entry<std::vector<std::string>>(config, "checks", {}).empty());
}

BOOST_AUTO_TEST_CASE(config_section_of_wrong_type) {
    BOOST_CHECK_THROW(util::config_value<std::string>(json::parse(R"({"merkle": "blake2b"})"), "merkle", "hasher",
                                                      "sha256"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(util::config_value<bool>(json::parse(R"({"output": [true]})"), "output", "print_proofs", false),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(config_entry_of_wrong_type) {
    BOOST_CHECK_THROW(util::config_entry<std::vector<std::string>>(json::parse(R"({"checks": "a@mail.com"})"),
                                                                   "checks", {}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(util::config_entry<std::vector<std::string>>(json::parse(R"({"checks": [1, 2]})"), "checks", {}),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
