#include <gtest/gtest.h>
#include "string_utils.h"

TEST(StringUtilsTest, ShouldJoinString) {
    std::vector<std::string> parts = {"foo", "bar", "baz", "bazinga"};

    const std::string & joined_str1 = StringUtils::join(parts, "/");
    ASSERT_STREQ("foo/bar/baz/bazinga", joined_str1.c_str());

    const std::string & joined_str2 = StringUtils::join(parts, "/", 2);
    ASSERT_STREQ("baz/bazinga", joined_str2.c_str());

    const std::string & joined_str3 = StringUtils::join({}, "/");
    ASSERT_STREQ("", joined_str3.c_str());
}

TEST(StringUtilsTest, ShouldSplitString) {
    std::vector<std::string> nodes;
    StringUtils::split("10.0.0.1,10.0.0.2,,10.0.0.3", nodes, ",");
    ASSERT_EQ(3, nodes.size());
    ASSERT_EQ("10.0.0.3", nodes[2]);

    // empty string should produce empty list
    std::vector<std::string> lines_empty;
    StringUtils::split("", lines_empty, "\n");
    ASSERT_TRUE(lines_empty.empty());

    std::string comma_and_space = "foo, bar";
    std::vector<std::string> comma_space_parts;
    StringUtils::split(comma_and_space, comma_space_parts, ",");
    ASSERT_STREQ("foo", comma_space_parts[0].c_str());
    ASSERT_STREQ("bar", comma_space_parts[1].c_str());

    // preserve trailing space
    std::string str_trailing_space = "foo\nbar ";
    std::vector<std::string> trailing_space_parts;
    StringUtils::split(str_trailing_space, trailing_space_parts, "\n", false, false);
    ASSERT_EQ(2, trailing_space_parts.size());
    ASSERT_EQ("foo", trailing_space_parts[0]);
    ASSERT_EQ("bar ", trailing_space_parts[1]);

    std::vector<std::string> with_empty;
    StringUtils::split("a,,b", with_empty, ",", true);
    ASSERT_EQ(3, with_empty.size());
    ASSERT_EQ("", with_empty[1]);
}

TEST(StringUtilsTest, ShouldSplitLines) {
    std::vector<std::string> lines = StringUtils::split_lines("8e9e05c52164694d: name=etcd10_0_0_1\r\n\n  \n"
                                                              "91bc3c398fb3c146: name=etcd10_0_0_2\n");
    ASSERT_EQ(2, lines.size());
    ASSERT_EQ("8e9e05c52164694d: name=etcd10_0_0_1", lines[0]);
    ASSERT_EQ("91bc3c398fb3c146: name=etcd10_0_0_2", lines[1]);
}

TEST(StringUtilsTest, ShouldTrimString) {
    std::string str = " a ";
    StringUtils::trim(str);
    ASSERT_STREQ("a", str.c_str());

    str = "abc";
    StringUtils::trim(str);
    ASSERT_STREQ("abc", str.c_str());

    str = " abc def   ";
    StringUtils::trim(str);
    ASSERT_STREQ("abc def", str.c_str());

    str = "\tabc\r\n";
    StringUtils::trim(str);
    ASSERT_STREQ("abc", str.c_str());

    str = "  ";
    StringUtils::trim(str);
    ASSERT_STREQ("", str.c_str());
}

TEST(StringUtilsTest, ReplaceAll) {
    std::string name = "etcd10.0.0.1";
    StringUtils::replace_all(name, ".", "_");
    ASSERT_EQ("etcd10_0_0_1", name);

    // replacement containing the search string must not loop
    std::string doubled = "a.b";
    StringUtils::replace_all(doubled, ".", "..");
    ASSERT_EQ("a..b", doubled);

    std::string unchanged = "abc";
    StringUtils::replace_all(unchanged, "", "x");
    ASSERT_EQ("abc", unchanged);
}

TEST(StringUtilsTest, StartsWithAndLowercase) {
    ASSERT_TRUE(StringUtils::starts_with("server pg_10.0.0.1_5432", "server "));
    ASSERT_FALSE(StringUtils::starts_with("serv", "server "));

    std::string role = "DataBase";
    StringUtils::tolowercase(role);
    ASSERT_EQ("database", role);
}
