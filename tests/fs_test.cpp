#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "adapters/fs.hpp"

namespace fs = std::filesystem;
using namespace nxup::adapters::fs;

TEST(InputResolverTest, PipedInputReplacesPositionalArguments)
{
    std::istringstream piped{"./docs/a.html\n./docs/b.html\n\n./docs/img/c.png\n"};
    const InputSource source{.stdin_is_pipe = true, .stdin_stream = &piped};

    const auto inputs = resolve_inputs({"ignored.txt"}, source);
    EXPECT_EQ(inputs, (std::vector<std::string>{"./docs/a.html", "./docs/b.html", "./docs/img/c.png"}));
}

TEST(InputResolverTest, PositionalArgumentsWithoutPipe)
{
    std::istringstream unused{"never.txt"};
    const InputSource source{.stdin_is_pipe = false, .stdin_stream = &unused};

    const auto inputs = resolve_inputs({"a.txt", "b.txt"}, source);
    EXPECT_EQ(inputs, (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST(InputResolverTest, EmptyPipeGivesNoFiles)
{
    std::istringstream piped{"  \n\t "};
    const InputSource source{.stdin_is_pipe = true, .stdin_stream = &piped};
    EXPECT_TRUE(resolve_inputs({"a.txt"}, source).empty());
}

TEST(InputResolverTest, TokensSplitOnAnyWhitespace)
{
    std::istringstream in{"a b\tc\r\nd"};
    const auto tokens = read_tokens(in);
    EXPECT_EQ(tokens, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(InputResolverTest, OnlyRegularFilesAreUploadable)
{
    const auto dir = fs::temp_directory_path() / "nxup_fs_test";
    fs::create_directories(dir);
    const auto file = dir / "regular.txt";
    std::ofstream(file) << "payload";

    EXPECT_TRUE(is_uploadable(file));
    EXPECT_FALSE(is_uploadable(dir));
    EXPECT_FALSE(is_uploadable(dir / "missing.txt"));
    EXPECT_EQ(file_size_or_zero(file), 7u);
    EXPECT_EQ(file_size_or_zero(dir / "missing.txt"), 0u);

    fs::remove_all(dir);
}
