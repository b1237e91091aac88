#include "config/validatorconfig.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "test_config.h"

using namespace pwguard::config;
using pwguard::validation::PasswordError;
using pwguard::validation::PasswordRule;
using pwguard::validation::PasswordValidator;

class ValidatorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) / "validatorconfig";
        std::filesystem::create_directories(testOutputPath);
    }

    void TearDown() override {
        std::filesystem::remove_all(testOutputPath);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = testOutputPath / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path testOutputPath;
};

TEST_F(ValidatorConfigTest, DefaultsMatchDefaultRules) {
    auto fromConfig = ValidatorConfig::defaults().toBuilder().build();
    auto reference = PasswordValidator::defaultRules();

    for (const char* password : {"Password123!", "pass", "password", "", "Päßwörd123!"}) {
        EXPECT_EQ(fromConfig.validate(password), reference.validate(password))
            << "password: " << password;
    }
}

TEST_F(ValidatorConfigTest, ParseOrderedRules) {
    auto config = ValidatorConfig::fromString(R"({
        "rules": [
            { "type": "special_character", "characters": "!@#" },
            { "type": "min_length", "length": 12 },
            { "type": "uppercase" },
            { "type": "digit" }
        ]
    })");

    ASSERT_EQ(config.rules().size(), 4u);
    EXPECT_EQ(config.rules()[0].type, RuleType::SpecialCharacter);
    EXPECT_EQ(config.rules()[0].specialCharacters, std::optional<std::string>("!@#"));
    EXPECT_EQ(config.rules()[1].type, RuleType::MinLength);
    EXPECT_EQ(config.rules()[1].minLength, 12);
    EXPECT_EQ(config.rules()[2].type, RuleType::Uppercase);
    EXPECT_EQ(config.rules()[3].type, RuleType::Digit);

    auto validator = config.toBuilder().build();
    EXPECT_TRUE(validator.validate("LongPassword1!").isValid());

    std::vector<PasswordError> expected = {
        PasswordError::missingSpecialChar(),
        PasswordError::tooShort()
    };
    EXPECT_EQ(validator.validate("Password1$").errors(), expected);
}

TEST_F(ValidatorConfigTest, OptionalFieldsUseDefaults) {
    auto config = ValidatorConfig::fromString(R"({
        "rules": [ { "type": "min_length" }, { "type": "special_character" } ]
    })");

    ASSERT_EQ(config.rules().size(), 2u);
    EXPECT_EQ(config.rules()[0].minLength, 8);
    EXPECT_FALSE(config.rules()[1].specialCharacters.has_value());

    auto validator = config.toBuilder().build();
    EXPECT_TRUE(validator.validate("password~").isValid());
    EXPECT_EQ(validator.validate("pass~").errors().size(), 1u);
}

TEST_F(ValidatorConfigTest, EmptyRuleListAcceptsAnything) {
    auto config = ValidatorConfig::fromString(R"({ "rules": [] })");
    EXPECT_TRUE(config.rules().empty());
    EXPECT_TRUE(config.toBuilder().build().validate("").isValid());
}

TEST_F(ValidatorConfigTest, UnknownOptionIsIgnored) {
    auto config = ValidatorConfig::fromString(R"({
        "rules": [ { "type": "digit", "comment": "at least one number" } ]
    })");
    ASSERT_EQ(config.rules().size(), 1u);
    EXPECT_EQ(config.rules()[0].type, RuleType::Digit);
}

TEST_F(ValidatorConfigTest, MalformedDocumentsAreRejected) {
    EXPECT_THROW(ValidatorConfig::fromString("not json"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString("[]"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(R"({ "rule": [] })"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(R"({ "rules": {} })"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(R"({ "rules": [ 42 ] })"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(R"({ "rules": [ {} ] })"), ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(R"({ "rules": [ { "type": "lowercase" } ] })"),
                 ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(
                     R"({ "rules": [ { "type": "min_length", "length": "8" } ] })"),
                 ConfigError);
    EXPECT_THROW(ValidatorConfig::fromString(
                     R"({ "rules": [ { "type": "special_character", "characters": 1 } ] })"),
                 ConfigError);
}

TEST_F(ValidatorConfigTest, LengthOutsideIntRangeIsRejected) {
    for (const char* length : {"3000000000", "4294967304", "-3000000000",
                               "18446744073709551615"}) {
        const std::string document =
            std::string(R"({ "rules": [ { "type": "min_length", "length": )") + length + " } ] }";
        EXPECT_THROW(ValidatorConfig::fromString(document), ConfigError) << "length: " << length;
    }

    auto config = ValidatorConfig::fromString(
        R"({ "rules": [ { "type": "min_length", "length": 2147483647 } ] })");
    ASSERT_EQ(config.rules().size(), 1u);
    EXPECT_EQ(config.rules()[0].minLength, 2147483647);
    EXPECT_EQ(config.toBuilder().build().validate("Password123!").errors().size(), 1u);
}

TEST_F(ValidatorConfigTest, ErrorNamesOffendingEntry) {
    try {
        ValidatorConfig::fromString(R"({ "rules": [ { "type": "digit" }, { "type": "emoji" } ] })");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("rules[1]"), std::string::npos) << message;
        EXPECT_NE(message.find("emoji"), std::string::npos) << message;
    }
}

TEST_F(ValidatorConfigTest, JsonRoundTrip) {
    auto original = ValidatorConfig::fromString(R"({
        "rules": [
            { "type": "min_length", "length": 10 },
            { "type": "special_character", "characters": "€§" },
            { "type": "special_character" },
            { "type": "uppercase" }
        ]
    })");

    auto written = original.toJson();
    EXPECT_EQ(written["rules"][0]["type"], "min_length");
    EXPECT_EQ(written["rules"][0]["length"], 10);
    EXPECT_FALSE(written["rules"][2].contains("characters"));

    EXPECT_EQ(ValidatorConfig::fromJson(written), original);
}

TEST_F(ValidatorConfigTest, LoadFromFile) {
    auto path = writeFile("policy.json", R"({
        "rules": [ { "type": "min_length", "length": 6 }, { "type": "digit" } ]
    })");

    auto validator = ValidatorConfig::fromFile(path).toBuilder().build();
    EXPECT_EQ(validator.ruleCount(), 2u);
    EXPECT_TRUE(validator.validate("abcde1").isValid());
    EXPECT_EQ(validator.validate("abc").errors().size(), 2u);
}

TEST_F(ValidatorConfigTest, FileErrors) {
    EXPECT_THROW(ValidatorConfig::fromFile(testOutputPath / "missing.json"), ConfigError);

    auto broken = writeFile("broken.json", "{ \"rules\": [");
    EXPECT_THROW(ValidatorConfig::fromFile(broken), ConfigError);
}

TEST_F(ValidatorConfigTest, CustomRulesAfterLoading) {
    class NoSpacesRule : public PasswordRule {
    public:
        std::optional<PasswordError> validate(std::string_view password) const override {
            if (password.find(' ') == std::string_view::npos) {
                return std::nullopt;
            }
            return PasswordError::custom("Password must not contain spaces");
        }
    };

    auto validator = ValidatorConfig::defaults()
        .toBuilder()
        .addRule(std::make_shared<NoSpacesRule>())
        .build();

    auto result = validator.validate("pass word");
    ASSERT_EQ(result.errors().size(), 4u);
    EXPECT_EQ(result.errors().back(), PasswordError::custom("Password must not contain spaces"));
}
