#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "reflect/shape_loader.hpp"
#include "schema/ddl_generator.hpp"
#include "schema/shape_diff.hpp"
#include "schema/table_builder.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace shapesql;

namespace {

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> format;
    std::optional<std::pair<std::string, std::string>> diff;
    std::vector<std::string> shape_files;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--format sql|json] [--diff OLD NEW] [SHAPE.json ...]\n",
        argv0);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            opts.format = utils::to_lower(argv[++i]);
        } else if (arg == "--diff" && i + 2 < argc) {
            opts.diff = std::make_pair(std::string(argv[i + 1]), std::string(argv[i + 2]));
            i += 2;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            utils::log::error(std::format("Unknown option: {}", arg));
            return std::nullopt;
        } else {
            opts.shape_files.push_back(arg);
        }
    }
    return opts;
}

bool write_output(const std::string& path, const std::string& content) {
    if (path.empty()) {
        std::cout << content << '\n';
        return true;
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        utils::log::error(std::format("Cannot open output file: {}", path));
        return false;
    }
    out << content << '\n';
    return static_cast<bool>(out);
}

int run_diff(const std::string& old_path, const std::string& new_path,
             const DdlGenerator& generator, const OutputConfig& output) {
    auto from = ShapeLoader::load_from_file(old_path);
    if (from.is_error()) {
        utils::log::error(from.error_message());
        return EXIT_FAILURE;
    }
    auto to = ShapeLoader::load_from_file(new_path);
    if (to.is_error()) {
        utils::log::error(to.error_message());
        return EXIT_FAILURE;
    }

    const auto diff = ShapeDiff::compute(from.value(), to.value());
    auto ddl = generator.alter_table(diff);
    if (ddl.is_error()) {
        utils::log::error(std::format("[{}] {}",
            error_category_to_string(ddl.error_category()), ddl.error_message()));
        return EXIT_FAILURE;
    }
    return write_output(output.file, ddl.value()) ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    ShapesqlConfig config;
    if (cli->config_file) {
        auto loaded = ConfigLoader::load_from_file(*cli->config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(loaded.config);
    }
    if (cli->format) {
        config.output.format = *cli->format;
    }

    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        for (const auto& err : errors) utils::log::error(err);
        return EXIT_FAILURE;
    }
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    const DdlGenerator generator(DdlOptions{config.output.schema, config.output.if_not_exists});

    if (cli->diff) {
        return run_diff(cli->diff->first, cli->diff->second, generator, config.output);
    }

    std::vector<std::string> inputs = config.shape_paths;
    inputs.insert(inputs.end(), cli->shape_files.begin(), cli->shape_files.end());
    if (inputs.empty()) {
        utils::log::error("No shape documents given");
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::vector<std::string> statements;
    nlohmann::json tables = nlohmann::json::array();
    int failures = 0;

    for (const auto& path : inputs) {
        utils::log::info(std::format("Converting {}", path));

        auto shape = ShapeLoader::load_from_file(path);
        if (shape.is_error()) {
            utils::log::error(shape.error_message());
            ++failures;
            continue;
        }

        auto table = TableBuilder::convert(*shape.value());
        if (table.is_error()) {
            utils::log::error(std::format("{}: [{}] {}", path,
                error_category_to_string(table.error_category()), table.error_message()));
            ++failures;
            continue;
        }

        if (!table.value().primary_key) {
            utils::log::warn(std::format("Table '{}' has no primary key", table.value().name));
        }

        if (config.output.format == "json") {
            tables.push_back(table_to_json(table.value()));
        } else {
            statements.push_back(generator.create_table(table.value()));
        }
    }

    if (failures > 0) {
        utils::log::error(std::format("{} of {} shape documents failed to convert",
            failures, inputs.size()));
        return EXIT_FAILURE;
    }

    const std::string content = (config.output.format == "json")
        ? tables.dump(2)
        : utils::join(statements, "\n\n");
    if (!write_output(config.output.file, content)) {
        return EXIT_FAILURE;
    }

    utils::log::info(std::format("Converted {} shape documents", inputs.size()));
    return EXIT_SUCCESS;
}
