#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "manifest/toml_document.h"

using namespace LayerGuard;

namespace {

TomlParseResult parseOk(const std::string& text) {
    TomlParseResult result = parseToml(text);
    EXPECT_TRUE(result.ok) << "line " << result.error_line << ": " << result.error;
    return result;
}

} // namespace

TEST(TomlDocumentTest, DependenciesKeepDeclarationOrder) {
    const auto result = parseOk(
        "[package]\n"
        "name = \"demo\"\n"
        "version = \"0.1.0\"\n"
        "\n"
        "[dependencies]\n"
        "serde = \"1.0\"\n"
        "tokio = { version = \"1\", features = [\"net\", \"rt\"] }\n"
        "\n"
        "[dependencies.reqwest]\n"
        "version = \"0.11\"\n"
        "default-features = false\n");

    const TomlValue* deps = result.root.find("dependencies");
    ASSERT_NE(deps, nullptr);
    ASSERT_TRUE(deps->isTable());
    const std::vector<std::string> expected = {"serde", "tokio", "reqwest"};
    EXPECT_EQ(deps->keys(), expected);

    const TomlValue* tokio = deps->find("tokio");
    ASSERT_NE(tokio, nullptr);
    const TomlValue* features = tokio->find("features");
    ASSERT_NE(features, nullptr);
    ASSERT_TRUE(features->isArray());
    ASSERT_EQ(features->items().size(), 2u);
    EXPECT_EQ(features->items()[1].asString(), "rt");

    const TomlValue* reqwest = deps->find("reqwest");
    ASSERT_NE(reqwest, nullptr);
    const TomlValue* defaults = reqwest->find("default-features");
    ASSERT_NE(defaults, nullptr);
    EXPECT_TRUE(defaults->isBoolean());
    EXPECT_FALSE(defaults->asBoolean());
}

TEST(TomlDocumentTest, StringForms) {
    const auto result = parseOk(
        "basic = \"tab\\tquote\\\" \\u00e9\"\n"
        "literal = 'C:\\path\\n'\n"
        "multi = \"\"\"\n"
        "line one\n"
        "line two\"\"\"\n"
        "folded = \"\"\"\\\n"
        "    joined \\\n"
        "    text\"\"\"\n"
        "raw = '''\n"
        "keep \\n as is'''\n"
        "\"quoted key\" = 1\n");

    EXPECT_EQ(result.root.find("basic")->asString(), "tab\tquote\" \xC3\xA9");
    EXPECT_EQ(result.root.find("literal")->asString(), "C:\\path\\n");
    EXPECT_EQ(result.root.find("multi")->asString(), "line one\nline two");
    EXPECT_EQ(result.root.find("folded")->asString(), "joined text");
    EXPECT_EQ(result.root.find("raw")->asString(), "keep \\n as is");
    ASSERT_NE(result.root.find("quoted key"), nullptr);
}

TEST(TomlDocumentTest, NumbersBooleansAndDates) {
    const auto result = parseOk(
        "int = 1_000\n"
        "neg = -7\n"
        "hex = 0xff\n"
        "bin = 0b101\n"
        "flt = 3.5\n"
        "exp = 1e3\n"
        "yes = true\n"
        "no = false\n"
        "when = 1979-05-27T07:32:00Z\n"
        "spaced = 1979-05-27 07:32:00\n"
        "day = 1979-05-27\n");

    EXPECT_EQ(result.root.find("int")->asInteger(), 1000);
    EXPECT_EQ(result.root.find("neg")->asInteger(), -7);
    EXPECT_EQ(result.root.find("hex")->asInteger(), 255);
    EXPECT_EQ(result.root.find("bin")->asInteger(), 5);
    EXPECT_DOUBLE_EQ(result.root.find("flt")->asFloat(), 3.5);
    EXPECT_DOUBLE_EQ(result.root.find("exp")->asFloat(), 1000.0);
    EXPECT_TRUE(result.root.find("yes")->asBoolean());
    EXPECT_FALSE(result.root.find("no")->asBoolean());
    EXPECT_EQ(result.root.find("when")->type(), TomlValue::Type::Datetime);
    EXPECT_EQ(result.root.find("spaced")->asString(), "1979-05-27 07:32:00");
    EXPECT_EQ(result.root.find("day")->type(), TomlValue::Type::Datetime);
}

TEST(TomlDocumentTest, MultilineArraysAndComments) {
    const auto result = parseOk(
        "# leading comment\n"
        "[dependencies]  # trailing comment\n"
        "tokio = { version = \"1\", features = [\n"
        "    \"net\",   # sockets\n"
        "    \"macros\",\n"
        "] }\n");

    const TomlValue* features = result.root.find("dependencies")->find("tokio")->find("features");
    ASSERT_NE(features, nullptr);
    ASSERT_EQ(features->items().size(), 2u);
    EXPECT_EQ(features->items()[0].asString(), "net");
    EXPECT_EQ(features->items()[1].asString(), "macros");
}

TEST(TomlDocumentTest, DottedKeysAndArrayTables) {
    const auto result = parseOk(
        "a.b.c = 1\n"
        "[target.'cfg(unix)'.dependencies]\n"
        "libc = \"0.2\"\n"
        "[[bin]]\n"
        "name = \"first\"\n"
        "[[bin]]\n"
        "name = \"second\"\n");

    const TomlValue* c = result.root.find("a")->find("b")->find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->asInteger(), 1);

    const TomlValue* unix_deps = result.root.find("target")->find("cfg(unix)")->find("dependencies");
    ASSERT_NE(unix_deps, nullptr);
    EXPECT_NE(unix_deps->find("libc"), nullptr);
    EXPECT_EQ(result.root.find("dependencies"), nullptr);

    const TomlValue* bins = result.root.find("bin");
    ASSERT_NE(bins, nullptr);
    ASSERT_TRUE(bins->isArray());
    ASSERT_EQ(bins->items().size(), 2u);
    EXPECT_EQ(bins->items()[1].find("name")->asString(), "second");
}

TEST(TomlDocumentTest, CrlfAndEmptyDocuments) {
    EXPECT_TRUE(parseToml("").ok);
    EXPECT_TRUE(parseToml("# only a comment\n\n").ok);

    const auto result = parseOk("[dependencies]\r\nserde = \"1\"\r\n");
    EXPECT_NE(result.root.find("dependencies")->find("serde"), nullptr);
}

TEST(TomlDocumentTest, ReportsFirstErrorWithLine) {
    struct Case {
        const char* text;
        uint32_t line;
    };
    const Case cases[] = {
        {"a = 1\nb = \n", 2},
        {"[dependencies\nserde = \"1\"\n", 1},
        {"a = 1\na = 2\n", 2},
        {"name = \"unterminated\n", 1},
        {"x = nope\n", 1},
        {"[a]\nk = 1\n[a]\n", 3},
        {"a = { b = 1 }\n[a]\n", 2},
        {"a = 1 b = 2\n", 1},
        {"arr = [1, 2\n", 2},
        {"s = \"bad \\q escape\"\n", 1},
    };

    for (const auto& c : cases) {
        const TomlParseResult result = parseToml(c.text);
        EXPECT_FALSE(result.ok) << c.text;
        EXPECT_EQ(result.error_line, c.line) << c.text << " -> " << result.error;
        EXPECT_FALSE(result.error.empty()) << c.text;
    }
}

TEST(TomlDocumentTest, DuplicateKeyErrorNamesKey) {
    const TomlParseResult result = parseToml("[dependencies]\nserde = \"1\"\nserde = \"2\"\n");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.find("serde"), std::string::npos);
    EXPECT_EQ(result.error_line, 3u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
