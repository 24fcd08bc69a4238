#ifndef DEPMAP_GRAPH_RENDERER_HPP
#define DEPMAP_GRAPH_RENDERER_HPP

#include "depmap/dependency_graph.hpp"

#include <filesystem>
#include <string>

namespace depmap {
    struct render_options {
        std::filesystem::path output_dir = ".";
        std::string output_base = "project_dependency_map";
        std::string format = "png";
        std::string title = "Project Dependency Map";
        bool view = true;
        bool keep_source = false;
    };

    enum class render_status { rendered, engine_missing };

    struct render_result {
        render_status status = render_status::engine_missing;
        std::filesystem::path source;
        std::filesystem::path image;
    };

    // The graph layout program that turns a DOT file into an image.
    class layout_engine {
    public:
        virtual ~layout_engine() = default;

        virtual bool available() const = 0;

        /// Returns the exit status of the layout run, 0 on success.
        virtual int render(const std::filesystem::path& source,
                           const std::filesystem::path& image,
                           const std::string& format) = 0;

        /// Opens the image in a viewer. Returns false if that did not work.
        virtual bool view(const std::filesystem::path& image) = 0;
    };

    // Runs Graphviz's dot found on PATH; images are opened with xdg-open.
    class graphviz_engine : public layout_engine {
    public:
        explicit graphviz_engine(std::string executable = "dot");

        /// Full path of the executable, empty if it is not on PATH.
        std::filesystem::path locate() const;

        bool available() const override;
        int render(const std::filesystem::path& source,
                   const std::filesystem::path& image,
                   const std::string& format) override;
        bool view(const std::filesystem::path& image) override;

    private:
        std::string executable_;
    };

    /// Writes <output_base>.dot and renders <output_base>.<format> next to
    /// it. If the engine is missing a diagnostic is printed, the DOT file is
    /// kept and engine_missing is returned. Throws std::runtime_error if the
    /// DOT file cannot be written or the engine fails.
    render_result render_dependency_map(const dependency_graph& graph,
                                        const render_options& options,
                                        layout_engine& engine);
}

#endif
