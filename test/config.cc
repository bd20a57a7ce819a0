#include "temporary_file.hh"

#include <gtest/gtest.h>
#include <minuniq/config.hh>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using minuniq::load_config;
using minuniq::parse_config;
using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(config, block_style) {
    auto config = parse_config("programs:\n"
                               "  - bots/a.py\n"
                               "  - bots/b.py\n"
                               "rounds: 10\n"
                               "image: minuniq-runner\n");
    ASSERT_EQ(config.programs, (vector<string>{"bots/a.py", "bots/b.py"}));
    ASSERT_EQ(config.rounds, 10U);
    ASSERT_EQ(config.image, std::optional<string>{"minuniq-runner"});
}

// NOLINTNEXTLINE
TEST(config, flow_style) {
    auto config = parse_config(R"({
        "programs": ["bots/a.py", "bots/b.py"],
        "rounds": 100,
        "image": "minuniq-runner"
    })");
    ASSERT_EQ(config.programs, (vector<string>{"bots/a.py", "bots/b.py"}));
    ASSERT_EQ(config.rounds, 100U);
    ASSERT_EQ(config.image, std::optional<string>{"minuniq-runner"});
}

// NOLINTNEXTLINE
TEST(config, image_is_optional) {
    auto config = parse_config("programs: [a.py]\nrounds: 0\n");
    ASSERT_EQ(config.programs, (vector<string>{"a.py"}));
    ASSERT_EQ(config.rounds, 0U);
    ASSERT_EQ(config.image, std::nullopt);
    ASSERT_EQ(parse_config("programs: [a.py]\nrounds: 1\nimage: null\n").image, std::nullopt);
    ASSERT_EQ(parse_config("programs: [a.py]\nrounds: 1\nimage: ~\n").image, std::nullopt);
}

// NOLINTNEXTLINE
TEST(config, unknown_keys_are_ignored) {
    auto config = parse_config("programs: [a.py]\nrounds: 2\ncomment: friendly match\n");
    ASSERT_EQ(config.rounds, 2U);
}

// NOLINTNEXTLINE
TEST(config, missing_fields) {
    ASSERT_THROW((void)parse_config("rounds: 1\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\n"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(config, invalid_fields) {
    ASSERT_THROW((void)parse_config("programs: []\nrounds: 1\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: a.py\nrounds: 1\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [[a.py]]\nrounds: 1\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\nrounds: -1\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\nrounds: 1.5\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\nrounds: ten\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\nrounds: 4294967296\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py]\nrounds: [1]\n"), std::runtime_error);
    ASSERT_THROW(
        (void)parse_config("programs: [a.py]\nrounds: 1\nimage: [img]\n"), std::runtime_error
    );
}

// NOLINTNEXTLINE
TEST(config, malformed_document) {
    ASSERT_THROW((void)parse_config(""), std::runtime_error);
    ASSERT_THROW((void)parse_config("programs: [a.py\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("- a.py\n- b.py\n"), std::runtime_error);
    ASSERT_THROW((void)parse_config("just text"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(config, load_from_file) {
    TemporaryFile file{
        "/tmp/minuniq-test-config.XXXXXX.yaml", "programs:\n  - x.py\n  - y.py\nrounds: 3\n"
    };
    auto config = load_config(file.path());
    ASSERT_EQ(config.programs, (vector<string>{"x.py", "y.py"}));
    ASSERT_EQ(config.rounds, 3U);
    ASSERT_EQ(config.image, std::nullopt);
}

// NOLINTNEXTLINE
TEST(config, load_nonexistent_file) {
    try {
        (void)load_config("/nonexistent/minuniq-config.yaml");
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        ASSERT_NE(string{e.what()}.find("/nonexistent/minuniq-config.yaml"), string::npos)
            << e.what();
    }
}
