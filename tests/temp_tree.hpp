#ifndef DEPMAP_TESTS_TEMP_TREE_HPP
#define DEPMAP_TESTS_TEMP_TREE_HPP

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

// Scratch directory removed again when the test ends.
class temp_tree {
public:
    temp_tree()
    {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path()
                / ("depmap_test_" + std::to_string(::getpid()) + "_"
                   + std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    ~temp_tree()
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    temp_tree(const temp_tree&) = delete;
    temp_tree& operator=(const temp_tree&) = delete;

    std::filesystem::path write(const std::string& relative,
                                const std::string& content = "")
    {
        std::filesystem::path file = root_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        EXPECT_TRUE(out.good()) << "could not write " << file;
        return file;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

#endif
