#include "depmap/dependency_mapper.hpp"
#include "fake_engine.hpp"
#include "temp_tree.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using namespace depmap;
namespace fs = std::filesystem;

class DependencyMapperTest : public ::testing::Test {
protected:
    temp_tree tree_;
    fake_engine engine_;
    mapper_options options_;

    void SetUp() override
    {
        options_.root = tree_.root() / "project";
        options_.render.output_dir = tree_.root() / "out";
        options_.render.view = false;
        fs::create_directories(options_.root);
    }

    void write(const std::string& relative, const std::string& source)
    {
        tree_.write("project/" + relative, source);
    }

    bool has_edge(const dependency_graph& graph, const std::string& from,
                  const std::string& to)
    {
        auto u = find_module(graph, from);
        auto v = find_module(graph, to);
        return u && v && boost::edge(*u, *v, graph).second;
    }
};

TEST_F(DependencyMapperTest, BuildsGraphFromProjectTree) {
    write("main.py", "import portfolio_manager\nfrom gui import window\n");
    write("portfolio_manager.py", "from core import pricing\nimport json\n");
    write("gui/window.py", "import portfolio_manager\n");
    write("core/pricing.py", "import math\n");

    auto result = generate_dependency_map(options_, engine_);

    EXPECT_EQ(result.modules.size(), 4u);
    EXPECT_TRUE(result.failures.empty());
    ASSERT_TRUE(result.render.has_value());
    EXPECT_EQ(*result.render, render_status::rendered);

    const auto& graph = result.graph;
    EXPECT_EQ(boost::num_vertices(graph), 4u);
    EXPECT_EQ(boost::num_edges(graph), 2u);
    EXPECT_TRUE(has_edge(graph, "main", "portfolio_manager"));
    EXPECT_TRUE(has_edge(graph, "gui.window", "portfolio_manager"));
    // "from gui import window" and "from core import pricing" name packages
    // that are not modules themselves.
    EXPECT_FALSE(has_edge(graph, "main", "gui.window"));

    auto pm = find_module(graph, "portfolio_manager");
    ASSERT_TRUE(pm.has_value());
    EXPECT_EQ(graph[*pm].in_degree, 2u);
    EXPECT_EQ(graph[*pm].category, module_category::standard);
}

TEST_F(DependencyMapperTest, BrokenFileDoesNotStopTheRun) {
    write("a.py", "import b\nimport broken\n");
    write("b.py", "import c\n");
    write("c.py", "");
    write("broken.py", "import a\ndef (:\n");

    auto result = generate_dependency_map(options_, engine_);

    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures.count("broken"), 1u);
    EXPECT_FALSE(find_module(result.graph, "broken").has_value());
    EXPECT_EQ(boost::num_vertices(result.graph), 3u);
    EXPECT_EQ(boost::num_edges(result.graph), 2u);

    auto a = find_module(result.graph, "a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(result.graph[*a].in_degree, 0u);
    EXPECT_EQ(result.graph[*a].category, module_category::entry_point);
}

TEST_F(DependencyMapperTest, IgnoredModuleIsLeftOut) {
    write("dependency_mapper.py", "import app\n");
    write("app.py", "import dependency_mapper\n");

    auto result = generate_dependency_map(options_, engine_);

    EXPECT_EQ(result.modules.size(), 2u);
    EXPECT_EQ(boost::num_vertices(result.graph), 1u);
    EXPECT_EQ(boost::num_edges(result.graph), 0u);
    EXPECT_FALSE(find_module(result.graph, "dependency_mapper").has_value());

    auto app = find_module(result.graph, "app");
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(result.graph[*app].in_degree, 0u);
}

TEST_F(DependencyMapperTest, EmptyProjectRendersNothing) {
    write("README.md", "nothing here");

    auto result = generate_dependency_map(options_, engine_);

    EXPECT_TRUE(result.modules.empty());
    EXPECT_FALSE(result.render.has_value());
    EXPECT_EQ(engine_.render_calls, 0);
}

TEST_F(DependencyMapperTest, MissingRendererStillCompletes) {
    write("main.py", "import helpers\n");
    write("helpers.py", "");
    engine_.installed = false;

    auto result = generate_dependency_map(options_, engine_);

    ASSERT_TRUE(result.render.has_value());
    EXPECT_EQ(*result.render, render_status::engine_missing);
    EXPECT_EQ(boost::num_edges(result.graph), 1u);
    EXPECT_TRUE(fs::exists(options_.render.output_dir / "project_dependency_map.dot"));
}

TEST_F(DependencyMapperTest, RepeatedRunsProduceTheSameGraph) {
    write("main.py", "import a, b, c\n");
    write("a.py", "import b\n");
    write("b.py", "import c\n");
    write("c.py", "import a\n");
    write("pkg/d.py", "import main\nimport c\n");
    options_.render.keep_source = true;

    auto read_dot = [&] {
        std::ifstream in(options_.render.output_dir / "project_dependency_map.dot");
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    };

    generate_dependency_map(options_, engine_);
    const std::string first = read_dot();
    generate_dependency_map(options_, engine_);
    const std::string second = read_dot();

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(DependencyMapperTest, UnreadableRootThrows) {
    options_.root = tree_.root() / "missing";
    EXPECT_THROW(generate_dependency_map(options_, engine_), fs::filesystem_error);
}
