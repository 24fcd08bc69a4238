#include "depmap/graph_renderer.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace depmap {
    namespace {
        std::string shell_quote(const std::string& arg)
        {
            std::string quoted = "'";
            for (char c : arg) {
                if (c == '\'') {
                    quoted += "'\\''";
                } else {
                    quoted += c;
                }
            }
            quoted += "'";
            return quoted;
        }

        bool is_executable_file(const fs::path& candidate)
        {
            std::error_code ec;
            fs::file_status status = fs::status(candidate, ec);
            if (ec || !fs::is_regular_file(status)) {
                return false;
            }
            const auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec
                                   | fs::perms::others_exec;
            return (status.permissions() & exec_bits) != fs::perms::none;
        }
    }

    graphviz_engine::graphviz_engine(std::string executable)
        : executable_(std::move(executable))
    {
    }

    fs::path graphviz_engine::locate() const
    {
        if (executable_.find('/') != std::string::npos) {
            return is_executable_file(executable_) ? fs::path(executable_)
                                                   : fs::path();
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) {
            return {};
        }
        std::istringstream dirs(path_env);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) {
                dir = ".";
            }
            fs::path candidate = fs::path(dir) / executable_;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        return {};
    }

    bool graphviz_engine::available() const
    {
        return !locate().empty();
    }

    int graphviz_engine::render(const fs::path& source, const fs::path& image,
                                const std::string& format)
    {
        std::string command = shell_quote(locate().string()) + " -T"
                              + shell_quote(format) + " "
                              + shell_quote(source.string()) + " -o "
                              + shell_quote(image.string());
        return std::system(command.c_str());
    }

    bool graphviz_engine::view(const fs::path& image)
    {
        std::string command = "xdg-open " + shell_quote(image.string())
                              + " >/dev/null 2>&1";
        return std::system(command.c_str()) == 0;
    }

    render_result render_dependency_map(const dependency_graph& graph,
                                        const render_options& options,
                                        layout_engine& engine)
    {
        if (!fs::exists(options.output_dir)) {
            if (!fs::create_directories(options.output_dir)) {
                throw std::runtime_error("unable to create output directory "
                                         + options.output_dir.string());
            }
        }

        render_result result;
        result.source = options.output_dir / (options.output_base + ".dot");
        result.image
            = options.output_dir / (options.output_base + "." + options.format);

        std::ofstream dot_file(result.source);
        if (!dot_file) {
            throw std::runtime_error("unable to open " + result.source.string()
                                     + " for writing");
        }
        write_dependency_dot(graph, dot_file, options.title);
        dot_file.close();

        if (!engine.available()) {
            std::cerr << "\n--- ERROR ---\n"
                      << "Graphviz not found. Make sure it is installed and "
                         "that 'dot' is on the system PATH.\n"
                      << "For instructions, visit: https://graphviz.org/download/\n"
                      << "The graph source has been saved anyway as '"
                      << result.source.string() << "'." << std::endl;
            result.status = render_status::engine_missing;
            return result;
        }

        int status = engine.render(result.source, result.image, options.format);
        if (status != 0) {
            throw std::runtime_error("graphviz render of "
                                     + result.source.string()
                                     + " failed with status "
                                     + std::to_string(status));
        }
        result.status = render_status::rendered;

        if (!options.keep_source) {
            std::error_code ec;
            if (!fs::remove(result.source, ec) && ec) {
                std::cerr << "Warning: unable to remove " << result.source.string()
                          << ": " << ec.message() << std::endl;
            }
        }

        std::cout << "\nSuccess! The dependency map was saved as '"
                  << result.image.string() << "'" << std::endl;

        if (options.view) {
            if (engine.view(result.image)) {
                std::cout << "The file was opened automatically." << std::endl;
            } else {
                std::cerr << "Warning: unable to open " << result.image.string()
                          << " in a viewer." << std::endl;
            }
        }
        return result;
    }
}
