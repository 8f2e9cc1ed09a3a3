#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "rules/rule_registry.h"

using namespace LayerGuard;

class RuleRegistryTest : public ::testing::Test {
protected:
    RuleRegistryTest() : registry_(RuleRegistry::builtin()) {}

    RuleRegistry registry_;
};

TEST_F(RuleRegistryTest, BuiltinProvidesCoreLayer) {
    const LayerRule* core = registry_.layerRuleFor("core");
    ASSERT_NE(core, nullptr);
    EXPECT_EQ(core->name(), "core");

    const std::vector<std::string> expected_patterns = {
        "src/core/**/*.rs", "src/lib.rs", "src/error.rs",
        "src/language_detector*.rs", "src/translator*.rs", "src/translation*.rs"
    };
    EXPECT_EQ(core->filePatterns(), expected_patterns);

    const std::vector<std::string> expected_imports = {
        "ui", "network", "filesystem", "web", "http", "tcp", "gui"
    };
    EXPECT_EQ(core->forbiddenImports(), expected_imports);
    EXPECT_EQ(core->forbiddenApiPatterns().size(), 5u);
}

TEST_F(RuleRegistryTest, UnknownLayerIsNotFound) {
    EXPECT_EQ(registry_.layerRuleFor("adapters"), nullptr);
    EXPECT_EQ(registry_.layerRuleFor(""), nullptr);
}

TEST_F(RuleRegistryTest, TokioForbidsOnlyNetworkFeatures) {
    const LayerRule* core = registry_.layerRuleFor(CORE_LAYER);
    ASSERT_NE(core, nullptr);

    const ForbiddenDependency* tokio = core->findForbiddenDependency("tokio");
    ASSERT_NE(tokio, nullptr);
    EXPECT_FALSE(tokio->isWildcard());
    const std::vector<std::string> expected = {"net", "tcp", "udp"};
    EXPECT_EQ(tokio->features(), expected);
}

TEST_F(RuleRegistryTest, WildcardPackagesAndAllowedPackages) {
    const LayerRule* core = registry_.layerRuleFor(CORE_LAYER);
    ASSERT_NE(core, nullptr);

    for (const char* package : {"reqwest", "hyper", "actix-web", "egui", "crossterm", "walkdir", "directories"}) {
        const ForbiddenDependency* dep = core->findForbiddenDependency(package);
        ASSERT_NE(dep, nullptr) << package;
        EXPECT_TRUE(dep->isWildcard()) << package;
        EXPECT_TRUE(dep->features().empty()) << package;
    }

    EXPECT_EQ(core->findForbiddenDependency("serde"), nullptr);
    EXPECT_EQ(core->findForbiddenDependency("tokio-util"), nullptr);
    EXPECT_EQ(core->forbiddenDependencies().size(), 21u);
}

TEST_F(RuleRegistryTest, ProfilesDescribeBothDetectorVariants) {
    const DetectionProfile* full = registry_.profileFor(Profiles::FULL);
    ASSERT_NE(full, nullptr);
    EXPECT_TRUE(full->std_requires_keyword);
    EXPECT_EQ(full->manifest_mode, ManifestMode::Structured);
    EXPECT_EQ(full->unreadable_policy, UnreadablePolicy::Skip);
    EXPECT_NE(std::find(full->std_denylist.begin(), full->std_denylist.end(), "std::path::Path"),
              full->std_denylist.end());

    const DetectionProfile* simplified = registry_.profileFor(Profiles::SIMPLIFIED);
    ASSERT_NE(simplified, nullptr);
    EXPECT_FALSE(simplified->std_requires_keyword);
    EXPECT_EQ(simplified->manifest_mode, ManifestMode::LineMatch);
    const std::vector<std::string> expected = {"std::net::", "std::fs::"};
    EXPECT_EQ(simplified->std_denylist, expected);

    EXPECT_EQ(registry_.profileFor("paranoid"), nullptr);

    const std::vector<std::string> names = {"full", "simplified"};
    EXPECT_EQ(registry_.profileNames(), names);
}

TEST_F(RuleRegistryTest, UnreadablePolicyOverrideLeavesProfileIntact) {
    const DetectionProfile* full = registry_.profileFor(Profiles::FULL);
    ASSERT_NE(full, nullptr);

    const DetectionProfile strict = full->withUnreadablePolicy(UnreadablePolicy::Fail);
    EXPECT_EQ(strict.unreadable_policy, UnreadablePolicy::Fail);
    EXPECT_EQ(strict.name, full->name);
    EXPECT_EQ(full->unreadable_policy, UnreadablePolicy::Skip);
}

TEST(RuleRegistryCustomTest, LayerNamesFollowRegistrationOrder) {
    std::vector<LayerRule> layers;
    layers.emplace_back("domain", std::vector<std::string>{"src/domain/**/*.rs"},
                        std::vector<std::string>{"adapters"}, ForbiddenDependencyList{},
                        std::vector<std::string>{});
    layers.emplace_back("adapters", std::vector<std::string>{"src/adapters/**/*.rs"},
                        std::vector<std::string>{"cli"}, ForbiddenDependencyList{},
                        std::vector<std::string>{});
    const RuleRegistry registry(std::move(layers), {fullProfile()});

    const std::vector<std::string> expected = {"domain", "adapters"};
    EXPECT_EQ(registry.layerNames(), expected);
    EXPECT_EQ(registry.layerCount(), 2u);
    ASSERT_NE(registry.layerRuleFor("adapters"), nullptr);
    EXPECT_EQ(registry.layerRuleFor("adapters")->forbiddenImports().front(), "cli");
    EXPECT_EQ(registry.profileFor(Profiles::SIMPLIFIED), nullptr);
}

TEST(LayerRuleTest, DuplicateEntriesCollapse) {
    ForbiddenDependencyList deps;
    deps.emplace_back("tokio", ForbiddenDependency::ofFeatures({"net", "net", "udp"}));
    deps.emplace_back("tokio", ForbiddenDependency::wildcard());

    const LayerRule rule("core", {"src/*.rs"}, {"ui", "ui", "", "web"}, std::move(deps), {});

    const std::vector<std::string> expected_imports = {"ui", "web"};
    EXPECT_EQ(rule.forbiddenImports(), expected_imports);

    ASSERT_EQ(rule.forbiddenDependencies().size(), 1u);
    const ForbiddenDependency* tokio = rule.findForbiddenDependency("tokio");
    ASSERT_NE(tokio, nullptr);
    EXPECT_TRUE(tokio->isWildcard());

    const ForbiddenDependency features = ForbiddenDependency::ofFeatures({"net", "net", "udp"});
    const std::vector<std::string> expected_features = {"net", "udp"};
    EXPECT_EQ(features.features(), expected_features);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
