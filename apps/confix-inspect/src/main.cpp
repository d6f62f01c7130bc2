/**
 * @file main.cpp
 * @brief confix-inspect: resolve a service configuration from all sources
 *
 * Sources, highest priority first:
 *   1. command line   --database.url=... --regions=eu,us
 *   2. environment    CONFIX_DATABASE_URL=... CONFIX_REGIONS=eu,us
 *   3. a YAML, JSON or properties file given with --config=FILE
 */

#include <confix/common/debug.hpp>
#include <confix/common/platform.hpp>
#include <confix/core/config/command_line.hpp>
#include <confix/core/config/config_source.hpp>
#include <confix/core/config/descriptor.hpp>
#include <confix/core/config/docs.hpp>
#include <confix/core/config/reader.hpp>
#include <confix/core/config/tree_loader.hpp>
#include <confix/core/config/writer.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace confix::core::config;
namespace debug = confix::common::debug;

namespace {

constexpr const char* CONFIX_INSPECT_VERSION = "1.0.0";
constexpr const char* ENV_PREFIX             = "CONFIX_";

// ============================================================================
// Service schema
// ============================================================================

struct Database {
    std::string url;
    std::string user;
    std::optional<std::string> password;
};

struct ServiceConfig {
    std::string name;
    int32_t port;
    Database database;
    std::vector<std::string> regions;
    std::chrono::milliseconds timeout;
};

ConfigDescriptor<ServiceConfig> service_descriptor() {
    auto database =
        nested("database",
               zip_all(string("url").describe("Connection URL"),
                       string("user").describe("Login name"),
                       string("password").optional().describe("Password, if the server requires one")))
            .to<Database>([](const Database& d) { return std::make_tuple(d.url, d.user, d.password); })
            .describe("Primary database");

    return zip_all(string("name").describe("Service name"),
                   int32("port").describe("Listening port"),
                   database,
                   list("regions", string()).describe("Regions the service is deployed to"),
                   duration("timeout").default_value(std::chrono::milliseconds(30000))
                       .describe("Request timeout (ms, s, m or h)"))
        .to<ServiceConfig>([](const ServiceConfig& c) {
            return std::make_tuple(c.name, c.port, c.database, c.regions, c.timeout);
        });
}

// ============================================================================
// Tool options
// ============================================================================

struct InspectOptions {
    std::optional<std::string> config_file;
    ConfigFormat output;
    bool docs;
    std::string log_level;
};

confix::common::Result<ConfigFormat> parse_output_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "yaml" || lower == "yml") {
        return ConfigFormat::YAML;
    }
    if (lower == "json") {
        return ConfigFormat::JSON;
    }
    if (lower == "properties") {
        return ConfigFormat::PROPERTIES;
    }
    return confix::common::Result<ConfigFormat>(confix::common::ErrorCode::CONFIG_INVALID_VALUE,
                                                "output format must be yaml, json or properties");
}

confix::common::Result<std::string> format_name(ConfigFormat format) {
    switch (format) {
        case ConfigFormat::JSON:
            return std::string("json");
        case ConfigFormat::PROPERTIES:
            return std::string("properties");
        default:
            return std::string("yaml");
    }
}

ConfigDescriptor<InspectOptions> options_descriptor() {
    return zip_all(string("config").optional(),
                   string("output").transform_or_fail(parse_output_format, format_name)
                       .default_value(ConfigFormat::YAML),
                   boolean("docs").default_value(false),
                   string("log-level").default_value("warn"))
        .to<InspectOptions>([](const InspectOptions& o) {
            return std::make_tuple(o.config_file, o.output, o.docs, o.log_level);
        });
}

/**
 * @brief Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "confix-inspect - resolve and print a service configuration\n"
              << "Version: " << CONFIX_INSPECT_VERSION << "\n\n"
              << "Usage: " << program_name << " [OPTIONS] [--key=value ...]\n\n"
              << "Options:\n"
              << "  --config=FILE         YAML, JSON or .properties configuration file\n"
              << "  --output=FORMAT       Output format: yaml (default), json or properties\n"
              << "  --docs=true           Print the configuration reference and exit\n"
              << "  --log-level=LEVEL     Log level (trace, debug, info, warn, error)\n"
              << "  --help                Show this help message\n\n"
              << "Any other --key=value argument overrides the configuration, e.g.\n"
              << "  " << program_name << " --config=service.yaml --port=9090 --regions=eu,us\n\n"
              << "Environment variables prefixed with " << ENV_PREFIX
              << " are read as well, e.g. " << ENV_PREFIX << "DATABASE_URL.\n"
              << std::endl;
}

/**
 * @brief CONFIX_-prefixed variables, prefix removed, '_' nesting keys
 */
ConfigSource environment_source() {
    std::map<std::string, std::string> variables;
    for (const auto& [key, value] : confix::common::platform::get_environment()) {
        if (key.rfind(ENV_PREFIX, 0) == 0 && key != "CONFIX_LOG_LEVEL") {
            variables.emplace(key.substr(std::char_traits<char>::length(ENV_PREFIX)), value);
        }
    }

    SourceOptions options;
    options.source_name     = "environment";
    options.key_delimiter   = '_';
    options.value_delimiter = ',';

    return ConfigSource::from_map(variables, options).convert_keys([](const std::string& key) {
        std::string upper = key;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    });
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (std::find_if(args.begin(), args.end(), [](const std::string& a) {
            return a == "--help" || a == "-h";
        }) != args.end()) {
        print_usage(argv[0]);
        return 0;
    }

    auto cli = from_args(args, '.', ',');

    auto options = read(options_descriptor(), cli);
    if (options.is_error()) {
        std::cerr << "Invalid options:\n" << options.error().pretty_print();
        return 1;
    }
    const auto& opts = options.value();

    debug::init_logging(debug::parse_log_level(opts.log_level));

    ConfigSource source = cli.or_else(environment_source());

    auto loader = create_tree_loader();
    if (opts.config_file) {
        auto file = loader->load_source(*opts.config_file);
        if (file.is_error()) {
            std::cerr << file.error().to_string() << std::endl;
            return 1;
        }
        source = source.or_else(file.value());
    }

    auto descriptor = service_descriptor();

    if (opts.docs) {
        std::cout << generate_docs(descriptor).to_markdown();
        return 0;
    }

    auto config = read(descriptor, source);
    if (config.is_error()) {
        std::cerr << "Configuration errors:\n" << config.error().pretty_print();
        return 2;
    }

    auto tree = write(descriptor, config.value());
    if (tree.is_error()) {
        std::cerr << tree.error().to_string() << std::endl;
        return 1;
    }

    auto text = loader->serialize(tree.value(), opts.output);
    if (text.is_error()) {
        std::cerr << text.error().to_string() << std::endl;
        return 1;
    }

    std::cout << text.value();
    debug::shutdown_logging();
    return 0;
}
