/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PersistenceSettingsTests
#include <boost/test/unit_test.hpp>

#include "managers/PersistenceSettings.hpp"
#include "persistence/PersistenceConfig.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

using namespace Strata;

namespace {

struct SettingsFixture {
    PersistenceSettings& settings = PersistenceSettings::Instance();
    std::filesystem::path file;

    SettingsFixture() {
        settings.restoreDefaults();
        std::random_device device;
        file = std::filesystem::temp_directory_path() /
               ("strata_settings_" + std::to_string(device()) + ".json");
    }

    ~SettingsFixture() {
        settings.restoreDefaults();
        std::error_code ec;
        std::filesystem::remove(file, ec);
    }

    void writeFile(const std::string& content) const {
        std::ofstream out(file);
        out << content;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(PersistenceSettingsTestSuite, SettingsFixture)

BOOST_AUTO_TEST_CASE(TestBuiltInDefaults) {
    BOOST_CHECK(settings.get<bool>("decay", "enabled", false));
    BOOST_CHECK_EQUAL(settings.get<float>("decay", "rainfall_reference"), 4000.0f);
    BOOST_CHECK_EQUAL(settings.get<int>("decay", "max_failure_events"), 8);
    BOOST_CHECK_EQUAL(settings.get<int>("restore", "search_radius"), 8);
    BOOST_CHECK_EQUAL(settings.get<std::string>("eligibility", "excluded_defs"), "void_monolith");
    BOOST_CHECK(settings.has("storage", "root"));
}

BOOST_AUTO_TEST_CASE(TestLoadMergesOverDefaults) {
    writeFile(R"({
        "storage": { "root": "/tmp/strata", "persistent_id": "colony_7" },
        "decay": { "rainfall_reference": 2500, "failure_mtb_days": 120.5, "enabled": false },
        "eligibility": { "excluded_defs": "filth, fire ,,blueprint" }
    })");

    BOOST_REQUIRE(settings.loadFromFile(file.string()));
    BOOST_CHECK_EQUAL(settings.get<std::string>("storage", "persistent_id"), "colony_7");
    BOOST_CHECK(!settings.get<bool>("decay", "enabled", true));
    // Whole numbers are stored as int and widened when read as float
    BOOST_CHECK_EQUAL(settings.get<int>("decay", "rainfall_reference"), 2500);
    BOOST_CHECK_EQUAL(settings.get<float>("decay", "rainfall_reference"), 2500.0f);
    BOOST_CHECK_CLOSE(settings.get<float>("decay", "failure_mtb_days"), 120.5f, 0.001f);
    // Untouched keys keep their defaults
    BOOST_CHECK_EQUAL(settings.get<int>("restore", "search_radius"), 8);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    BOOST_CHECK_EQUAL(settings.get<int>("storage", "root", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<bool>("decay", "seed", true), true);
    BOOST_CHECK_EQUAL(settings.get<int>("missing", "key", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestBadFilesAreRejected) {
    BOOST_CHECK(!settings.loadFromFile((file.parent_path() / "strata_no_such_settings.json").string()));

    writeFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(file.string()));

    writeFile("{ \"decay\": { \"enabled\": tru } }");
    BOOST_CHECK(!settings.loadFromFile(file.string()));
    BOOST_CHECK(settings.get<bool>("decay", "enabled", false));
}

BOOST_AUTO_TEST_CASE(TestSetRemoveAndSave) {
    BOOST_CHECK(settings.set("storage", "persistent_id", "saved_id"));
    BOOST_CHECK(settings.set("restore", "search_radius", 3));
    BOOST_CHECK(settings.remove("storage", "root"));
    BOOST_CHECK(!settings.remove("storage", "root"));

    BOOST_REQUIRE(settings.saveToFile(file.string()));
    settings.restoreDefaults();
    BOOST_CHECK_EQUAL(settings.get<int>("restore", "search_radius"), 8);

    BOOST_REQUIRE(settings.loadFromFile(file.string()));
    BOOST_CHECK_EQUAL(settings.get<std::string>("storage", "persistent_id"), "saved_id");
    BOOST_CHECK_EQUAL(settings.get<int>("restore", "search_radius"), 3);

    const auto categories = settings.getCategories();
    BOOST_CHECK(std::find(categories.begin(), categories.end(), "decay") != categories.end());
    BOOST_CHECK_EQUAL(settings.getKeys("restore").size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestClearAll) {
    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
    BOOST_CHECK(!settings.has("decay", "enabled"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PersistenceConfigTestSuite, SettingsFixture)

BOOST_AUTO_TEST_CASE(TestFromDefaults) {
    const PersistenceConfig config = PersistenceConfig::fromSettings(settings);
    BOOST_CHECK(config.storageRoot.empty());
    BOOST_CHECK(config.persistentId.empty());
    BOOST_CHECK_EQUAL(config.excludedDefs.size(), 1u);
    BOOST_CHECK_EQUAL(config.excludedDefs.count("void_monolith"), 1u);
    BOOST_CHECK(config.decay.enabled);
    BOOST_CHECK_EQUAL(config.decay.rainfallReference, 4000.0f);
    BOOST_CHECK_EQUAL(config.decay.maxFailureEvents, 8);
    BOOST_CHECK_EQUAL(config.decaySeed, 0u);
    BOOST_CHECK_EQUAL(config.restoreSearchRadius, 8);
}

BOOST_AUTO_TEST_CASE(TestFromLoadedFile) {
    writeFile(R"({
        "eligibility": { "excluded_defs": "filth, fire ,,blueprint" },
        "decay": { "seed": 99, "max_failure_events": -4 },
        "restore": { "search_radius": 12 }
    })");
    BOOST_REQUIRE(settings.loadFromFile(file.string()));

    const PersistenceConfig config = PersistenceConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.excludedDefs.size(), 3u);
    BOOST_CHECK_EQUAL(config.excludedDefs.count("fire"), 1u);
    BOOST_CHECK_EQUAL(config.excludedDefs.count("blueprint"), 1u);
    BOOST_CHECK_EQUAL(config.decaySeed, 99u);
    BOOST_CHECK_EQUAL(config.decay.maxFailureEvents, 0);
    BOOST_CHECK_EQUAL(config.restoreSearchRadius, 12);
}

BOOST_AUTO_TEST_CASE(TestFailureEventCapIsHard) {
    settings.set("decay", "max_failure_events", 20);
    BOOST_CHECK_EQUAL(PersistenceConfig::fromSettings(settings).decay.maxFailureEvents, FAILURE_EVENT_CAP);

    settings.set("decay", "max_failure_events", 5);
    BOOST_CHECK_EQUAL(PersistenceConfig::fromSettings(settings).decay.maxFailureEvents, 5);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveRainfallReferenceFallsBack) {
    settings.set("decay", "rainfall_reference", 0.0f);
    BOOST_CHECK_EQUAL(PersistenceConfig::fromSettings(settings).decay.rainfallReference, 4000.0f);

    settings.set("decay", "rainfall_reference", -10);
    BOOST_CHECK_EQUAL(PersistenceConfig::fromSettings(settings).decay.rainfallReference, 4000.0f);
}

BOOST_AUTO_TEST_CASE(TestParseDefList) {
    BOOST_CHECK(PersistenceConfig::parseDefList("").empty());
    BOOST_CHECK(PersistenceConfig::parseDefList(" , ,").empty());

    const auto defs = PersistenceConfig::parseDefList("a, b,c ,a");
    BOOST_CHECK_EQUAL(defs.size(), 3u);
    BOOST_CHECK_EQUAL(defs.count("b"), 1u);
    BOOST_CHECK_EQUAL(defs.count("c"), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
