#include "anndoc/settings.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace anndoc;

namespace {

Settings parse(std::vector<std::string> args) {
    args.insert(args.begin(), "anndoc_cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

class SettingsFile : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "anndoc_test_settings.xml";
        std::ofstream out(path_);
        out << R"(<anndoc indent="4">
  <parameters>
    <item pid="ud" input="ud.json" evaluation="0" />
    <item pid="ner" input="ner.json" ents="1" verbose="1" />
  </parameters>
</anndoc>
)";
    }

    void TearDown() override { std::filesystem::remove(path_); }

    std::filesystem::path path_;
};

} // namespace

TEST(Arguments, ReadsKeyValuesAndFlags) {
    Settings settings = parse({"--input=doc.json", "--ents", "--indent=0", "stray", "--debug"});
    EXPECT_EQ(settings.input(), "doc.json");
    EXPECT_EQ(settings.get("ents"), "1");
    EXPECT_TRUE(settings.get_bool("ents", false));
    EXPECT_EQ(settings.get_int("indent", 2), 0);
    EXPECT_TRUE(settings.debug());
    EXPECT_FALSE(settings.verbose());
    EXPECT_EQ(settings.get("stray", "none"), "none");
    EXPECT_EQ(settings.get_int("missing", 7), 7);
}

TEST(Arguments, NonNumericIntegerOptionThrows) {
    Settings settings = parse({"--indent=wide"});
    EXPECT_THROW(settings.get_int("indent", 2), std::invalid_argument);
}

TEST(Arguments, ValuesMayContainEquals) {
    Settings settings = parse({"--get=id,text", "--outfile=a=b.json"});
    EXPECT_EQ(settings.get("get"), "id,text");
    EXPECT_EQ(settings.outfile(), "a=b.json");
}

TEST_F(SettingsFile, SelectsParameterSetByPid) {
    Settings base = parse({"--settings=" + path_.string(), "--pid=ner"});
    Settings settings = load_settings(base);
    EXPECT_EQ(settings.input(), "ner.json");
    EXPECT_TRUE(settings.get_bool("ents", false));
    EXPECT_TRUE(settings.verbose());
    EXPECT_EQ(settings.get_int("indent", 2), 4);
}

TEST_F(SettingsFile, FallsBackToFirstParameterSet) {
    Settings settings = load_settings(parse({"--settings=" + path_.string()}));
    EXPECT_EQ(settings.pid(), "ud");
    EXPECT_EQ(settings.input(), "ud.json");
    EXPECT_FALSE(settings.get_bool("evaluation", true));
}

TEST_F(SettingsFile, CommandLineWins) {
    Settings base = parse({"--settings=" + path_.string(), "--pid=ner", "--input=mine.json", "--indent=0"});
    Settings settings = load_settings(base);
    EXPECT_EQ(settings.input(), "mine.json");
    EXPECT_EQ(settings.get_int("indent", 2), 0);
}

TEST_F(SettingsFile, UnknownPidThrows) {
    Settings base = parse({"--settings=" + path_.string(), "--pid=nope"});
    EXPECT_THROW(load_settings(base), std::runtime_error);
}

TEST(SettingsLoading, MissingFileThrows) {
    Settings base = parse({"--settings=/nonexistent/anndoc.xml"});
    EXPECT_THROW(load_settings(base), std::runtime_error);
}
