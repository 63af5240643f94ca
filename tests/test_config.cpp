#include <catch2/catch.hpp>
#include "config.h"
#include <cstdio>
#include <fstream>

using namespace llink;

TEST_CASE("parseConfig: missing keys keep defaults", "[config]")
{
    auto result = parseConfig(R"({"discovery": {"timeoutMs": 5000}, "autoConnectLastPrinter": true})");
    REQUIRE(result.isSuccess());

    const LabelLinkConfig &config = result.value();
    REQUIRE(config.discovery.timeoutMs == 5000);
    REQUIRE(config.discovery.networkProbePeriodMs == 6000);
    REQUIRE(config.connection.timeoutMs == 30000);
    REQUIRE(config.print.timeoutMs == 30000);
    REQUIRE(config.autoConnectLastPrinter);
    REQUIRE_FALSE(config.enableDebugLogging);
}

TEST_CASE("parseConfig: malformed documents", "[config]")
{
    SECTION("not JSON")
    {
        auto result = parseConfig("{timeoutMs: ");
        REQUIRE(result.code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }

    SECTION("not an object")
    {
        auto result = parseConfig("[1, 2, 3]");
        REQUIRE(result.code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }

    SECTION("wrong value type")
    {
        auto result = parseConfig(R"({"connection": {"timeoutMs": "fast"}})");
        REQUIRE(result.code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }
}

TEST_CASE("configToJson: written config parses back", "[config]")
{
    LabelLinkConfig config;
    config.print.smartSettleMs = 900;
    config.log.logLevel = 1;

    auto parsed = parseConfig(configToJson(config));
    REQUIRE(parsed.isSuccess());
    REQUIRE(parsed.value().print.smartSettleMs == 900);
    REQUIRE(parsed.value().log.logLevel == 1);
}

TEST_CASE("loadConfigFromFile", "[config]")
{
    SECTION("missing file")
    {
        auto result = loadConfigFromFile("/nonexistent/label_link.json");
        REQUIRE(result.code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }

    SECTION("file on disk")
    {
        const std::string path = "label_link_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"print": {"genericSettleMs": 250}})";
        }
        auto result = loadConfigFromFile(path);
        std::remove(path.c_str());
        REQUIRE(result.isSuccess());
        REQUIRE(result.value().print.genericSettleMs == 250);
    }
}
