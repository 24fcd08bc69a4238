#include "depmap/python_ast.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    // One interpreter for the whole run; ast.parse is needed by most suites.
    depmap::python_interpreter interpreter;
    return RUN_ALL_TESTS();
}
