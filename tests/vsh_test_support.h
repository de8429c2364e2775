#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "builtin/builtin.h"
#include "session.h"
#include "shell.h"
#include "vfs/inode_store.h"
#include "vfs/virtual_filesystem.h"
#include "vsh.h"

// Fresh in-memory filesystem with the default tree, a default session and
// the full builtin registry.
class ShellTest : public ::testing::Test {
   protected:
    ShellTest()
        : fs_(std::make_unique<vfs::MemoryInodeStore>()), registry_(create_builtin_registry()) {
    }

    void SetUp() override {
        config::max_nesting_depth = config::kDefaultMaxNestingDepth;
        auto init = fs_.initialize();
        ASSERT_TRUE(init.is_ok()) << init.error();
        session_ = Session::create_default(fs_);
        shell_ = std::make_unique<Shell>(fs_, session_, registry_);
    }

    ExecResult run(const std::string& line) {
        return shell_->exec(line);
    }

    std::string read(const std::string& path) {
        auto content = fs_.read_file(path);
        EXPECT_TRUE(content.is_ok()) << path;
        return content.is_ok() ? content.value() : std::string();
    }

    void write(const std::string& path, const std::string& content) {
        auto result = fs_.write_file(path, content);
        ASSERT_TRUE(result.is_ok()) << result.error();
    }

    vfs::VirtualFilesystem fs_;
    CommandRegistry registry_;
    Session session_;
    std::unique_ptr<Shell> shell_;
};
