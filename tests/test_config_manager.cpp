// EN: Unit tests for the YAML ConfigManager - typed values, environment overrides and validation rules
// FR: Tests unitaires du ConfigManager YAML - valeurs typées, surcharges d'environnement et règles de validation

#include <gtest/gtest.h>
#include "app/application.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace ARL;

namespace {

const std::string kSampleYaml = R"(
logging:
  level: debug
  file: ""

lint_cache:
  ttl_seconds: 600
  max_entries: 2000
  auto_cleanup: true

lint:
  icon_base_url: ${ARL_TEST_ICON_HOST}/areas/
  verified_max_age_days: 180
  ruleset_version: "2"
  skip_rules:
    - geo-json-missing
    - icon-missing
)";

} // namespace

// EN: Test fixture resetting the singleton around each test
// FR: Fixture de test réinitialisant le singleton autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override { config().reset(); }
    void TearDown() override { config().reset(); }

    ConfigManager& config() { return ConfigManager::getInstance(); }
};

TEST_F(ConfigManagerTest, ConfigValueTypes) {
    ConfigValue flag(true);
    ConfigValue count(42);
    ConfigValue ratio(0.5);
    ConfigValue text("hello");
    ConfigValue list(std::vector<std::string>{"a", "b"});

    EXPECT_TRUE(flag.as<bool>());
    EXPECT_EQ(count.as<int>(), 42);
    EXPECT_DOUBLE_EQ(count.as<double>(), 42.0);
    EXPECT_DOUBLE_EQ(ratio.as<double>(), 0.5);
    EXPECT_EQ(text.as<std::string>(), "hello");
    EXPECT_EQ(list.as<std::vector<std::string>>().size(), 2u);

    EXPECT_FALSE(count.tryAs<std::string>().has_value());
    EXPECT_EQ(count.asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_EQ(flag.toString(), "true");
    EXPECT_FALSE(ConfigValue().isValid());
    EXPECT_THROW(ConfigValue().as<int>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, LoadsTypedYamlScalars) {
    ASSERT_EQ(setenv("ARL_TEST_ICON_HOST", "https://cdn.example", 1), 0);
    ASSERT_TRUE(config().loadFromString(kSampleYaml));

    EXPECT_EQ(config().get("logging", "level").as<std::string>(), "debug");
    EXPECT_EQ(config().get("logging", "file").as<std::string>(), "");
    EXPECT_EQ(config().get("lint_cache", "ttl_seconds").as<int>(), 600);
    EXPECT_TRUE(config().get("lint_cache", "auto_cleanup").as<bool>());
    EXPECT_EQ(config().get("lint", "icon_base_url").as<std::string>(), "https://cdn.example/areas/");
    EXPECT_EQ(config().get("lint", "ruleset_version").as<std::string>(), "2");
    EXPECT_EQ(config().get("lint", "skip_rules").as<std::vector<std::string>>(),
              (std::vector<std::string>{"geo-json-missing", "icon-missing"}));
    unsetenv("ARL_TEST_ICON_HOST");
}

TEST_F(ConfigManagerTest, UnsetVariableIsLeftInPlace) {
    unsetenv("ARL_TEST_ICON_HOST");
    ASSERT_TRUE(config().loadFromString(kSampleYaml));
    EXPECT_EQ(config().get("lint", "icon_base_url").as<std::string>(), "${ARL_TEST_ICON_HOST}/areas/");
}

TEST_F(ConfigManagerTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config().loadFromString("lint: [unterminated"));
    EXPECT_FALSE(config().loadFromFile("no_such_arealint_config.yaml"));
}

TEST_F(ConfigManagerTest, LoadingFileReplacesSections) {
    const std::string path = "test_config_manager.yaml";
    {
        std::ofstream file(path);
        file << "lint:\n  verified_max_age_days: 90\n";
    }
    config().set("lint_cache", "ttl_seconds", ConfigValue(5));

    ASSERT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().get("lint", "verified_max_age_days").as<int>(), 90);
    EXPECT_FALSE(config().has("lint_cache", "ttl_seconds"));
    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKnownKeys) {
    ASSERT_EQ(setenv("ARLTEST_LINT_CACHE_TTL", "45", 1), 0);
    ASSERT_EQ(setenv("ARLTEST_LOG_LEVEL", "warn", 1), 0);

    EXPECT_EQ(config().loadEnvironmentOverrides("ARLTEST_"), 2u);
    EXPECT_EQ(config().get("lint_cache", "ttl_seconds").as<int>(), 45);
    EXPECT_EQ(config().get("logging", "level").as<std::string>(), "warn");

    unsetenv("ARLTEST_LINT_CACHE_TTL");
    unsetenv("ARLTEST_LOG_LEVEL");
}

TEST_F(ConfigManagerTest, ValidationFillsDefaults) {
    config().addValidationRules(App::Application::configurationRules());

    std::vector<std::string> errors;
    ASSERT_TRUE(config().validate(errors)) << (errors.empty() ? "" : errors.front());
    EXPECT_EQ(config().get("lint_cache", "ttl_seconds").as<int>(), 3600);
    EXPECT_EQ(config().get("lint", "verified_max_age_days").as<int>(), 365);
    EXPECT_EQ(config().get("logging", "level").as<std::string>(), "info");
}

TEST_F(ConfigManagerTest, ValidationReportsTypeRangeAndEnumErrors) {
    config().addValidationRules(App::Application::configurationRules());
    config().set("lint_cache", "ttl_seconds", ConfigValue(-1));
    config().set("lint_cache", "max_entries", ConfigValue("many"));
    config().set("logging", "level", ConfigValue("chatty"));

    std::vector<std::string> errors;
    EXPECT_FALSE(config().validate(errors));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "Configuration logging.level must be one of: debug, info, warn, warning, error");
    EXPECT_EQ(errors[1], "Configuration lint_cache.ttl_seconds must be >= 0");
    EXPECT_EQ(errors[2], "Configuration lint_cache.max_entries must be an integer");
}

TEST_F(ConfigManagerTest, RequiredKeyWithoutDefault) {
    ConfigManager::ValidationRule rule;
    rule.key = "lint.ruleset_version";
    rule.type = "string";
    rule.required = true;
    config().addValidationRules({rule});

    std::vector<std::string> errors;
    EXPECT_FALSE(config().validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Required configuration missing: lint.ruleset_version");
}

TEST_F(ConfigManagerTest, DumpListsSectionsInOrder) {
    CONFIG_SET("lint", "verified_max_age_days", 30);
    CONFIG_SET("lint_cache", "auto_cleanup", false);

    const std::string dump = config().dump();
    const size_t lint_pos = dump.find("[lint]");
    const size_t cache_pos = dump.find("[lint_cache]");
    ASSERT_NE(lint_pos, std::string::npos);
    ASSERT_NE(cache_pos, std::string::npos);
    EXPECT_LT(lint_pos, cache_pos);
    EXPECT_NE(dump.find("verified_max_age_days = 30"), std::string::npos);
    EXPECT_EQ(CONFIG_GET("lint_cache", "auto_cleanup").as<bool>(), false);
}

// EN: Main test runner
// FR: Lanceur de test principal
int main(int argc, char** argv) {
    ARL::Logger::getInstance().setLogLevel(ARL::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
