#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "detectors/pattern_detector.h"
#include "rules/rule_registry.h"
#include "test_tree.h"

using namespace LayerGuard;
using LayerGuardTest::TempTree;

class PatternDetectorTest : public ::testing::Test {
protected:
    PatternDetectorTest()
        : detector_("core", UnreadablePolicy::Skip, coreLayerRule().forbiddenApiPatterns()) {}

    PatternDetector detector_;
};

TEST_F(PatternDetectorTest, FlagsUsageOutsideImports) {
    const auto violations = detector_.scanLines("src/core/net.rs", {
        "fn connect(addr: &str) {",
        "    let stream = TcpStream::connect(addr);",
        "}",
    });

    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].kind(), ViolationKind::FORBIDDEN_API_USAGE);
    EXPECT_EQ(violations[0].line(), 2u);
    EXPECT_NE(violations[0].detail().find("'TcpStream'"), std::string::npos);
    EXPECT_NE(violations[0].detail().find(": let stream = TcpStream::connect(addr);"), std::string::npos);
}

TEST_F(PatternDetectorTest, EachMatchingPatternYieldsOneViolation) {
    const auto violations = detector_.scanLines("src/lib.rs", {"use tokio::net::TcpListener;"});

    ASSERT_EQ(violations.size(), 2u);
    EXPECT_NE(violations[0].detail().find("'tokio::net::'"), std::string::npos);
    EXPECT_NE(violations[1].detail().find("'TcpListener'"), std::string::npos);
    EXPECT_EQ(violations[0].line(), violations[1].line());
}

TEST_F(PatternDetectorTest, CommentsAndStringsAreNotExcluded) {
    const auto violations = detector_.scanLines("src/lib.rs", {
        "// never use UdpSocket here",
        "let msg = \"tokio::fs::read is off limits\";",
    });

    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].line(), 1u);
    EXPECT_EQ(violations[1].line(), 2u);
}

TEST_F(PatternDetectorTest, CleanSourceYieldsNothing) {
    EXPECT_TRUE(detector_.scanLines("src/lib.rs", {
        "use tokio::sync::Mutex;",
        "pub struct Parser;",
        "",
    }).empty());
}

TEST_F(PatternDetectorTest, InvalidPatternIsDropped) {
    const PatternDetector detector("core", UnreadablePolicy::Skip, {"(unclosed", "UdpSocket"});

    EXPECT_EQ(detector.patternCount(), 1u);
    const auto violations = detector.scanLines("src/lib.rs", {"let s = UdpSocket::bind(a);"});
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_NE(violations[0].detail().find("'UdpSocket'"), std::string::npos);
}

TEST_F(PatternDetectorTest, ScansFilesAndAppliesUnreadablePolicy) {
    TempTree tree;
    tree.write("src/lib.rs", "pub mod io;\nuse std::net::TcpStream;\n");
    tree.write("src/bad.rs", std::string("TcpStream\n\xc3\x28\n"));

    const auto violations = detector_.scan(tree.path("src/lib.rs"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].line(), 2u);
    EXPECT_EQ(violations[0].file(), tree.path("src/lib.rs"));

    EXPECT_TRUE(detector_.scan(tree.path("src/bad.rs")).empty());

    const PatternDetector strict("core", UnreadablePolicy::Fail, coreLayerRule().forbiddenApiPatterns());
    const auto unreadable = strict.scan(tree.path("src/bad.rs"));
    ASSERT_EQ(unreadable.size(), 1u);
    EXPECT_EQ(unreadable[0].kind(), ViolationKind::UNREADABLE_FILE);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
