#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "main_loop.h"
#include "utils/command_line_parser.h"
#include "utils/config_loader.h"
#include "vsh_test_support.h"

using vsh_filesystem::ErrorKind;

namespace {

class ArgvBuilder {
   public:
    explicit ArgvBuilder(std::vector<std::string> args) : storage_(std::move(args)) {
        for (auto& arg : storage_) {
            pointers_.push_back(&arg[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }
    char** argv() {
        return pointers_.data();
    }

   private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class CommandLineTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config::reset_defaults();
    }
    void TearDown() override {
        config::reset_defaults();
    }
};

}  // namespace

// config file
TEST(ConfigFileTest, ParsesEveryKey) {
    auto parsed = vsh_config::parse_config(R"({
        "store_path": "/var/tmp/vfs.json",
        "persist": false,
        "max_nesting_depth": 12,
        "env": {"EDITOR": "vi", "HOME": "/home/admin"},
        "aliases": {"ll": "ls -l"}
    })");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const auto& file = parsed.value();
    EXPECT_EQ(file.store_path.value(), "/var/tmp/vfs.json");
    EXPECT_FALSE(file.persist.value());
    EXPECT_EQ(file.max_nesting_depth.value(), 12);
    EXPECT_EQ(file.env.at("EDITOR"), "vi");
    EXPECT_EQ(file.aliases.at("ll"), "ls -l");
}

TEST(ConfigFileTest, EmptyObjectLeavesEverythingUnset) {
    auto parsed = vsh_config::parse_config("{}");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_FALSE(parsed.value().store_path.has_value());
    EXPECT_FALSE(parsed.value().persist.has_value());
    EXPECT_TRUE(parsed.value().env.empty());
}

TEST(ConfigFileTest, RejectsBadDocuments) {
    const std::vector<std::string> bad = {
        "[1, 2]",
        "{ broken",
        R"({"persist": "yes"})",
        R"({"max_nesting_depth": 0})",
        R"({"env": ["A"]})",
        R"({"aliases": {"x": 1}})",
    };
    for (const auto& text : bad) {
        auto parsed = vsh_config::parse_config(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.kind(), ErrorKind::InvalidArgument) << text;
        EXPECT_EQ(parsed.error().rfind("config: ", 0), 0u) << text;
    }
}

TEST(ConfigFileTest, MissingFileIsEmptyConfig) {
    auto loaded = vsh_config::load_config_file("/nonexistent/vsh/config.json");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().aliases.empty());
}

TEST(ConfigFileTest, LoadsFromDisk) {
    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 ("vsh_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"env": {"LANG": "C"}})";
    }
    auto loaded = vsh_config::load_config_file(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().env.at("LANG"), "C");
}

TEST(ConfigFileTest, AppliesToGlobalsAndSession) {
    config::reset_defaults();
    vsh_config::ConfigFile file;
    file.store_path = "/srv/vfs.json";
    file.persist = false;
    file.max_nesting_depth = 9;
    file.env["EDITOR"] = "nano";
    file.env["USER"] = "alice";
    file.aliases["la"] = "ls -a";

    vsh_config::apply_to_globals(file);
    EXPECT_EQ(config::store_path, "/srv/vfs.json");
    EXPECT_FALSE(config::persistence_enabled);
    EXPECT_EQ(config::max_nesting_depth, 9);

    Session session;
    session.env["USER"] = "user";
    vsh_config::apply_to_session(file, session);
    EXPECT_EQ(session.get_env("USER"), "alice");
    EXPECT_EQ(session.get_env("EDITOR"), "nano");
    EXPECT_EQ(session.aliases.at("la"), "ls -a");

    config::reset_defaults();
}

// command line
TEST_F(CommandLineTest, CommandOption) {
    ArgvBuilder args({"vsh", "-c", "echo hi"});
    auto result = vsh::CommandLineParser::parse_arguments(args.argc(), args.argv());
    EXPECT_FALSE(result.should_exit);
    EXPECT_TRUE(config::execute_command);
    EXPECT_EQ(config::cmd_to_execute, "echo hi");
    EXPECT_FALSE(config::interactive_mode);
}

TEST_F(CommandLineTest, StoreAndMemoryOptions) {
    ArgvBuilder store({"vsh", "--store", "/tmp/alt.json", "-N"});
    vsh::CommandLineParser::parse_arguments(store.argc(), store.argv());
    EXPECT_EQ(config::store_path, "/tmp/alt.json");
    EXPECT_TRUE(config::persistence_enabled);
    EXPECT_FALSE(config::source_enabled);

    ArgvBuilder memory({"vsh", "--memory"});
    vsh::CommandLineParser::parse_arguments(memory.argc(), memory.argv());
    EXPECT_FALSE(config::persistence_enabled);
}

TEST_F(CommandLineTest, ScriptOperandTakesRemainingArguments) {
    ArgvBuilder args({"vsh", "setup.vsh", "-c", "x"});
    auto result = vsh::CommandLineParser::parse_arguments(args.argc(), args.argv());
    EXPECT_EQ(result.script_file, "setup.vsh");
    std::vector<std::string> expected = {"-c", "x"};
    EXPECT_EQ(result.script_args, expected);
    EXPECT_FALSE(config::execute_command);
}

TEST_F(CommandLineTest, VersionAndHelpFlags) {
    ArgvBuilder version({"vsh", "--version"});
    vsh::CommandLineParser::parse_arguments(version.argc(), version.argv());
    EXPECT_TRUE(config::show_version);

    ArgvBuilder help({"vsh", "-h"});
    vsh::CommandLineParser::parse_arguments(help.argc(), help.argv());
    EXPECT_TRUE(config::show_help);
}

TEST_F(CommandLineTest, UnknownOptionExitsWithUsageStatus) {
    ArgvBuilder args({"vsh", "--bogus"});
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    auto result = vsh::CommandLineParser::parse_arguments(args.argc(), args.argv());
    testing::internal::GetCapturedStdout();
    testing::internal::GetCapturedStderr();
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 2);
}

// prompt and script runner
TEST(PromptTest, AbbreviatesHome) {
    Session session;
    session.env["HOME"] = "/home/user";
    session.env["USER"] = "user";
    session.cwd = "/home/user";
    EXPECT_EQ(build_prompt(session), "user@vsh:~$ ");
    session.cwd = "/home/user/src";
    EXPECT_EQ(build_prompt(session), "user@vsh:~/src$ ");
    session.cwd = "/home/username";
    EXPECT_EQ(build_prompt(session), "user@vsh:/home/username$ ");
    session.cwd = "/";
    EXPECT_EQ(build_prompt(session), "user@vsh:/$ ");
}

TEST_F(ShellTest, ScriptTextStopsAtExit) {
    testing::internal::CaptureStdout();
    int status = run_script_text(*shell_, "echo one\n\nexit 7\necho two\n");
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(status, 7);
    EXPECT_EQ(out, "one\n");
}

TEST_F(ShellTest, ScriptTextReturnsLastStatus) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    int status = run_script_text(*shell_, "cd /tmp\nnosuch\n");
    testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(status, 127);
    EXPECT_EQ(err, "nosuch: command not found\n");
    EXPECT_EQ(session_.cwd, "/tmp");
}
