#pragma once

#include "locus/class_path.hpp"
#include "locus/loader.hpp"
#include "locus/resources/url.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace locus {

// Loader configuration
//
// Config format:
//   log_level: info          # silent | error | warn | info | verbose
//   loader: default          # default | filesystem
//
//   class_path:              # relative entries resolve against the config directory
//     - resources
//     - /usr/share/app
//
//   url:
//     connect_timeout_ms: 5000
//     timeout_ms: 30000
//     user_agent: locus
//     follow_redirects: true
//
//   aliases:                 # registered as PrefixProtocolResolvers, in order
//     - prefix: "cloud:"
//       target: "classpath:"
struct LoaderConfig {
    struct Alias {
        std::string prefix;
        std::string target;
    };

    enum class LoaderKind { Default, FileSystem };

    LoaderKind loader = LoaderKind::Default;
    ClassPath class_path;
    UrlOptions url;
    std::vector<Alias> aliases;
    std::optional<int> log_level;

    // Defaults: class path from LOCUS_CLASS_PATH or the working directory
    static LoaderConfig defaults();

    // Load from YAML file; throws LocusError(ConfigError)
    static LoaderConfig from_file(const std::string& config_path);

    // Load from a parsed node; relative class path entries resolve against base_dir
    static LoaderConfig from_yaml(const YAML::Node& config, const std::filesystem::path& base_dir);

    // Apply log_level and build the configured loader with its aliases registered
    std::unique_ptr<DefaultResourceLoader> create_loader() const;
};

} // namespace locus
