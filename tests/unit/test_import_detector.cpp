#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "detectors/import_detector.h"
#include "rules/rule_registry.h"
#include "test_tree.h"

using namespace LayerGuard;
using LayerGuardTest::TempTree;

class ImportDetectorTest : public ::testing::Test {
protected:
    ImportDetectorTest()
        : forbidden_(coreLayerRule().forbiddenImports()),
          full_("core", fullProfile()),
          simplified_("core", simplifiedProfile()) {}

    std::vector<Violation> scanFull(const std::vector<std::string>& lines) const {
        return full_.scanLines("src/lib.rs", lines, forbidden_);
    }

    std::vector<std::string> forbidden_;
    ImportDetector full_;
    ImportDetector simplified_;
};

TEST_F(ImportDetectorTest, FlagsInteriorAndFinalSegments) {
    const auto violations = scanFull({
        "use crate::ui::Widget;",
        "    use crate::network;",
    });

    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].kind(), ViolationKind::FORBIDDEN_IMPORT);
    EXPECT_EQ(violations[0].line(), 1u);
    EXPECT_EQ(violations[0].file(), "src/lib.rs");
    EXPECT_NE(violations[0].detail().find("'ui'"), std::string::npos);
    EXPECT_NE(violations[0].detail().find("use crate::ui::Widget;"), std::string::npos);

    EXPECT_EQ(violations[1].line(), 2u);
    EXPECT_NE(violations[1].detail().find("'network'"), std::string::npos);
    // Detail echoes the trimmed line
    EXPECT_NE(violations[1].detail().find(": use crate::network;"), std::string::npos);
}

TEST_F(ImportDetectorTest, FlagsLeadingSegment) {
    const std::vector<std::string> forbidden = {"forbidden_layer"};

    const auto violations = full_.scanLines("src/core/engine.rs", {"use forbidden_layer::helper;"}, forbidden);

    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].kind(), ViolationKind::FORBIDDEN_IMPORT);
    EXPECT_EQ(violations[0].line(), 1u);
}

TEST_F(ImportDetectorTest, EveryMatchingTokenYieldsOneViolation) {
    const auto violations = scanFull({"use crate::ui::http;"});

    ASSERT_EQ(violations.size(), 2u);
    EXPECT_NE(violations[0].detail().find("'ui'"), std::string::npos);
    EXPECT_NE(violations[1].detail().find("'http'"), std::string::npos);
}

TEST_F(ImportDetectorTest, NoFalsePositiveOnAbsence) {
    const auto violations = scanFull({
        "use crate::uikit::Button;",
        "use crate::guidance;",
        "use crate::core::webhook_parser;",
        "let ui = build_ui();",
        "// use crate::ui;",
        "fn network_free() {}",
        "",
    });

    EXPECT_TRUE(violations.empty());
}

TEST_F(ImportDetectorTest, StdDenylistNeedsKeywordUnderFullProfile) {
    const std::vector<std::string> lines = {
        "use std::fs::File;",
        "let data = std::fs::read(path)?;",
        "use std::path::Path;",
        "extern crate std::net;",
    };

    const auto full = scanFull(lines);
    ASSERT_EQ(full.size(), 3u);
    EXPECT_EQ(full[0].kind(), ViolationKind::FORBIDDEN_STD_IMPORT);
    EXPECT_EQ(full[0].line(), 1u);
    EXPECT_NE(full[0].detail().find("'std::fs'"), std::string::npos);
    EXPECT_EQ(full[1].line(), 3u);
    EXPECT_EQ(full[2].line(), 4u);

    const auto simplified = simplified_.scanLines("src/lib.rs", lines, forbidden_);
    // std::path::Path and a bare std::net are outside the simplified deny list
    ASSERT_EQ(simplified.size(), 2u);
    EXPECT_EQ(simplified[0].line(), 1u);
    EXPECT_EQ(simplified[1].line(), 2u);
    EXPECT_NE(simplified[1].detail().find("'std::fs::'"), std::string::npos);
}

TEST_F(ImportDetectorTest, ReadsFileWithPhysicalLineNumbers) {
    TempTree tree;
    tree.write("src/lib.rs",
               "//! crate root\n"
               "\n"
               "use crate::ui::render;\n"
               "pub fn f() {}\n");

    const auto violations = full_.scan(tree.path("src/lib.rs"), forbidden_);

    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].line(), 3u);
    EXPECT_EQ(violations[0].file(), tree.path("src/lib.rs"));
}

TEST_F(ImportDetectorTest, UndecodableFileFollowsUnreadablePolicy) {
    TempTree tree;
    tree.write("src/lib.rs", std::string("use crate::ui;\n\xff\xfe\n"));

    EXPECT_TRUE(full_.scan(tree.path("src/lib.rs"), forbidden_).empty());

    const ImportDetector strict("core", fullProfile().withUnreadablePolicy(UnreadablePolicy::Fail));
    const auto violations = strict.scan(tree.path("src/lib.rs"), forbidden_);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].kind(), ViolationKind::UNREADABLE_FILE);
    EXPECT_EQ(violations[0].line(), 0u);

    const auto missing = strict.scan(tree.path("src/missing.rs"), forbidden_);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].kind(), ViolationKind::UNREADABLE_FILE);
}

TEST(ImportPathTest, ReferencesModuleSegments) {
    EXPECT_TRUE(ImportDetector::referencesModule("crate::ui::Widget", "ui"));
    EXPECT_TRUE(ImportDetector::referencesModule("crate::ui", "ui"));
    EXPECT_TRUE(ImportDetector::referencesModule("ui::Widget", "ui"));
    EXPECT_TRUE(ImportDetector::referencesModule("ui", "ui"));
    EXPECT_FALSE(ImportDetector::referencesModule("crate::uikit", "ui"));
    EXPECT_FALSE(ImportDetector::referencesModule("crate::my_ui", "ui"));
    EXPECT_FALSE(ImportDetector::referencesModule("uikit::Button", "ui"));
    EXPECT_FALSE(ImportDetector::referencesModule("", "ui"));
}

TEST(ImportPathTest, ExtractsPathAfterKeyword) {
    const ImportDetector detector("core", fullProfile());
    EXPECT_EQ(detector.importPath("use crate::ui::Widget;"), "crate::ui::Widget");
    EXPECT_EQ(detector.importPath("use crate::network ;"), "crate::network");
    EXPECT_EQ(detector.importPath("let x = 1;"), "");
    EXPECT_EQ(detector.importPath("user::ui;"), "");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
