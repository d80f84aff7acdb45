#include <gtest/gtest.h>
#include "tools/ArgumentReader.h"
#include "core/Errors.h"

TEST(ArgumentReaderTest, NullArgumentsAreEmptyObject) {
    ArgumentReader reader(nullptr);
    EXPECT_EQ(reader.requireString("region", "europe-west1", "bad"), "europe-west1");
}

TEST(ArgumentReaderTest, RejectsNonObjectArguments) {
    EXPECT_THROW(ArgumentReader{nlohmann::json::array()}, ValidationError);
    EXPECT_THROW(ArgumentReader{nlohmann::json("text")}, ValidationError);
}

TEST(ArgumentReaderTest, RequireStringUsesFallbackAndRejectsBlank) {
    ArgumentReader reader({{"project", "p1"}, {"blank", "  "}, {"number", 3}});

    EXPECT_EQ(reader.requireString("project", "default", "bad"), "p1");
    EXPECT_EQ(reader.requireString("missing", "default", "bad"), "default");

    try {
        reader.requireString("blank", "default", "Project must be specified");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "Project must be specified");
    }
    EXPECT_THROW(reader.requireString("number", "", "bad"), ValidationError);
    EXPECT_THROW(reader.requireString("missing", "", "bad"), ValidationError);
}

TEST(ArgumentReaderTest, OptionalStringMustBeNonEmptyWhenPresent) {
    ArgumentReader reader({{"projectId", ""}, {"name", "x"}});

    EXPECT_FALSE(reader.optionalString("missing", "bad").has_value());
    EXPECT_EQ(reader.optionalString("name", "bad"), std::optional<std::string>("x"));
    EXPECT_THROW(reader.optionalString("projectId", "bad"), ValidationError);
}

TEST(ArgumentReaderTest, IntegerAcceptsNumericStringsWithinRange) {
    ArgumentReader reader({{"port", "9090"}, {"big", 70000}, {"junk", "80a"}});

    EXPECT_EQ(reader.integer("port", 8080, 1, 65535, "bad"), 9090);
    EXPECT_EQ(reader.integer("missing", 8080, 1, 65535, "bad"), 8080);
    EXPECT_THROW(reader.integer("big", 8080, 1, 65535, "bad"), ValidationError);
    EXPECT_THROW(reader.integer("junk", 8080, 1, 65535, "bad"), ValidationError);
}

TEST(ArgumentReaderTest, ArraysMustBePresentAndNonEmpty) {
    ArgumentReader reader({{"files", nlohmann::json::array()}, {"paths", {"/a", "/b"}}, {"mixed", {"/a", 1}}});

    try {
        reader.stringArray("missing", "Files must be specified", "No files specified for deployment");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "Files must be specified");
    }
    try {
        reader.stringArray("files", "Files must be specified", "No files specified for deployment");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "No files specified for deployment");
    }
    EXPECT_EQ(reader.stringArray("paths", "m", "e"), (std::vector<std::string>{"/a", "/b"}));
    EXPECT_THROW(reader.stringArray("mixed", "m", "e"), ValidationError);
}
