#include <gtest/gtest.h>
#include <core/glob.hpp>

TEST(Glob, SingleAsteriskStaysInSegment) {
    EXPECT_TRUE(glob_match("file*.txt", "file.txt"));
    EXPECT_TRUE(glob_match("file*.txt", "file123.txt"));
    EXPECT_FALSE(glob_match("file*.txt", "folder/file.txt"));
    EXPECT_TRUE(glob_match("logs/*.txt", "logs/app.txt"));
    EXPECT_FALSE(glob_match("logs/*.txt", "logs/sub/app.txt"));
}

TEST(Glob, DoubleAsteriskCrossesDirectories) {
    EXPECT_TRUE(glob_match("logs/**/*.txt", "logs/app.txt"));
    EXPECT_TRUE(glob_match("logs/**/*.txt", "logs/sub/app.txt"));
    EXPECT_TRUE(glob_match("logs/**/*.txt", "logs/sub/deep/app.txt"));
    EXPECT_FALSE(glob_match("logs/**/*.txt", "data/logs/app.txt"));
}

TEST(Glob, DoubleAsteriskAtStart) {
    EXPECT_TRUE(glob_match("**/*.txt", "file.txt"));
    EXPECT_TRUE(glob_match("**/*.txt", "sub/file.txt"));
    EXPECT_TRUE(glob_match("**/*.txt", "a/b/c/file.txt"));
}

TEST(Glob, DoubleAsteriskAtEnd) {
    EXPECT_TRUE(glob_match("logs/**", "logs/app.txt"));
    EXPECT_TRUE(glob_match("logs/**", "logs/sub/app.txt"));
    EXPECT_TRUE(glob_match("logs/**", "logs/"));
    EXPECT_FALSE(glob_match("logs/**", "data/app.txt"));
}

TEST(Glob, DoubleAsteriskMidSegment) {
    EXPECT_TRUE(glob_match("logs**txt", "logs/app.txt"));
    EXPECT_TRUE(glob_match("logs**txt", "logsapp.txt"));
    EXPECT_TRUE(glob_match("logs**txt", "logs/sub/app.txt"));
}

TEST(Glob, SeveralDoubleAsterisks) {
    EXPECT_TRUE(glob_match("**/sub/**/*.txt", "sub/file.txt"));
    EXPECT_TRUE(glob_match("**/sub/**/*.txt", "a/sub/b/file.txt"));
    EXPECT_TRUE(glob_match("**/sub/**/*.txt", "a/b/sub/c/d/file.txt"));
}

TEST(Glob, QuestionMark) {
    EXPECT_TRUE(glob_match("file?.txt", "file1.txt"));
    EXPECT_TRUE(glob_match("file?.txt", "fileA.txt"));
    EXPECT_FALSE(glob_match("file?.txt", "file12.txt"));
    EXPECT_FALSE(glob_match("file?.txt", "file/.txt"));
}

TEST(Glob, CharacterClasses) {
    EXPECT_TRUE(glob_match("file_[abc].txt", "file_a.txt"));
    EXPECT_TRUE(glob_match("file_[abc].txt", "file_c.txt"));
    EXPECT_FALSE(glob_match("file_[abc].txt", "file_d.txt"));

    EXPECT_TRUE(glob_match("program_[a-z].cpz", "program_x.cpz"));
    EXPECT_FALSE(glob_match("program_[a-z].cpz", "program_A.cpz", true));

    EXPECT_TRUE(glob_match("build_[A-Z][0-9].lpz", "build_Z9.lpz"));
    EXPECT_FALSE(glob_match("build_[A-Z][0-9].lpz", "build_a1.lpz", true));
    EXPECT_FALSE(glob_match("build_[A-Z][0-9].lpz", "build_A10.lpz"));
}

TEST(Glob, NegatedClasses) {
    EXPECT_TRUE(glob_match("test_[!0-9].txt", "test_a.txt"));
    EXPECT_FALSE(glob_match("test_[!0-9].txt", "test_5.txt"));
    EXPECT_TRUE(glob_match("log_[!a-z].dat", "log_1.dat"));
    EXPECT_TRUE(glob_match("log_[!a-z].dat", "log_A.dat", true));
    EXPECT_FALSE(glob_match("log_[!a-z].dat", "log_x.dat"));
}

TEST(Glob, BracketsWithoutClassAreLiteral) {
    EXPECT_TRUE(glob_match("file[abc.txt", "file[abc.txt"));
    EXPECT_FALSE(glob_match("file[abc.txt", "filea.txt"));
    EXPECT_TRUE(glob_match("file_[].txt", "file_[].txt"));
    EXPECT_FALSE(glob_match("file_[].txt", "file_a.txt"));
}

TEST(Glob, MixedPattern) {
    EXPECT_TRUE(glob_match("src/**/release/*.[ch]", "src/release/main.c"));
    EXPECT_TRUE(glob_match("src/**/release/*.[ch]", "src/app/release/module.h"));
    EXPECT_FALSE(glob_match("src/**/release/*.[ch]", "src/app/release/module.cpp"));

    EXPECT_TRUE(glob_match("src/**/test_[0-9][0-9].?pz", "src/tests/test_01.cpz"));
    EXPECT_TRUE(glob_match("src/**/test_[0-9][0-9].?pz", "src/a/b/c/test_99.lpz"));
    EXPECT_FALSE(glob_match("src/**/test_[0-9][0-9].?pz", "src/test_1.cpz"));
    EXPECT_FALSE(glob_match("src/**/test_[0-9][0-9].?pz", "src/test_01.xyz"));
}

TEST(Glob, SegmentCounts) {
    EXPECT_TRUE(glob_match("*/*/*.txt", "a/b/c.txt"));
    EXPECT_FALSE(glob_match("*/*/*.txt", "a/b.txt"));
    EXPECT_FALSE(glob_match("*/*/*.txt", "a/b/c/d.txt"));
}

TEST(Glob, RegexCharactersAreLiteral) {
    EXPECT_FALSE(glob_match("file.txt", "fileatxt"));
    EXPECT_TRUE(glob_match("file(1).txt", "file(1).txt"));
    EXPECT_TRUE(glob_match("file+.txt", "file+.txt"));
    EXPECT_TRUE(glob_match("file^.txt", "file^.txt"));
    EXPECT_TRUE(glob_match("file$.txt", "file$.txt"));
}

TEST(Glob, CaseSensitivity) {
    EXPECT_TRUE(glob_match("File.TXT", "file.txt"));
    EXPECT_TRUE(glob_match("*.TXT", "file.txt"));
    EXPECT_TRUE(glob_match("Program?.CPZ", "ProgramA.cpz"));
    EXPECT_FALSE(glob_match("Program?.CPZ", "ProgramA.cpz", true));
    EXPECT_TRUE(glob_match("Program?.CPZ", "ProgramA.CPZ", true));
}

TEST(Glob, BackslashesNormalized) {
    EXPECT_TRUE(glob_match("logs\\*.txt", "logs/app.txt"));
    EXPECT_TRUE(glob_match("logs/*.txt", "logs\\app.txt"));
    EXPECT_TRUE(glob_match("logs\\**\\*.txt", "logs\\sub\\app.txt"));
}

TEST(Glob, EmptyInputs) {
    EXPECT_THROW(glob_match("", "test.txt"), std::invalid_argument);
    EXPECT_FALSE(glob_match("*.txt", ""));
}

TEST(Glob, FilterKeepsOrder) {
    std::vector<std::string> paths = {"a.txt", "b.log", "c.txt", "d.xml", "e.txt"};
    EXPECT_EQ(glob_filter("*.txt", paths), (std::vector<std::string>{"a.txt", "c.txt", "e.txt"}));
    EXPECT_TRUE(glob_filter("*.txt", {}).empty());
    EXPECT_TRUE(glob_filter("*.txt", {"file.log", "data.xml"}).empty());

    std::vector<std::string> logs = {"logs/app.log", "logs/archive/old.log", "data/data.log"};
    EXPECT_EQ(glob_filter("logs/**/*.log", logs),
              (std::vector<std::string>{"logs/app.log", "logs/archive/old.log"}));
}

TEST(Glob, BasePath) {
    EXPECT_EQ(glob_base_path("logs/2024/*.txt"), "logs/2024");
    EXPECT_EQ(glob_base_path("logs/**/*.log"), "logs");
    EXPECT_EQ(glob_base_path("*.txt"), "");
    EXPECT_EQ(glob_base_path("logs\\sub\\?.txt"), "logs/sub");
    EXPECT_TRUE(glob_has_wildcard("a/[bc].txt"));
    EXPECT_FALSE(glob_has_wildcard("a/b.txt"));
}
