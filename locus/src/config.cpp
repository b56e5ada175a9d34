#include "locus/config.hpp"
#include "locus/error.hpp"
#include "locus/file_system_loader.hpp"
#include "locus/log.hpp"
#include "locus/path_utils.hpp"

namespace locus {

LoaderConfig LoaderConfig::defaults() {
    LoaderConfig config;
    config.class_path = ClassPath::from_environment();
    return config;
}

LoaderConfig LoaderConfig::from_file(const std::string& config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw LocusError(ErrorCode::ConfigError, config_path,
            std::string("Failed to load config: ") + e.what());
    }

    // Relative class path entries resolve against the config directory
    std::filesystem::path config_dir = std::filesystem::path(config_path).parent_path();
    if (config_dir.empty()) {
        config_dir = ".";
    }
    config_dir = std::filesystem::weakly_canonical(config_dir);

    LOG_VERBOSE("Config directory: " << config_dir);

    try {
        return from_yaml(config, config_dir);
    } catch (const YAML::Exception& e) {
        throw LocusError(ErrorCode::ConfigError, config_path,
            std::string("Invalid config: ") + e.what());
    }
}

LoaderConfig LoaderConfig::from_yaml(const YAML::Node& config, const std::filesystem::path& base_dir) {
    LoaderConfig result;

    if (config.IsNull()) {
        result.class_path = ClassPath::from_environment();
        return result;
    }
    if (!config.IsMap()) {
        throw LocusError(ErrorCode::ConfigError, "Config root must be a map");
    }

    if (config["log_level"]) {
        std::string name = config["log_level"].as<std::string>();
        int level = parse_log_level(name);
        if (level < 0) {
            throw LocusError(ErrorCode::ConfigError, name, "Unknown log_level '" + name + "'");
        }
        result.log_level = level;
    }

    if (config["loader"]) {
        std::string kind = config["loader"].as<std::string>();
        if (kind == "default") {
            result.loader = LoaderKind::Default;
        } else if (kind == "filesystem") {
            result.loader = LoaderKind::FileSystem;
        } else {
            throw LocusError(ErrorCode::ConfigError, kind, "Unknown loader type '" + kind + "'");
        }
    }

    if (config["class_path"]) {
        const auto& entries = config["class_path"];
        if (!entries.IsSequence()) {
            throw LocusError(ErrorCode::ConfigError, "class_path must be a list of directories");
        }
        for (const auto& entry : entries) {
            std::filesystem::path root(entry.as<std::string>());
            if (root.is_relative()) {
                root = base_dir / root;
            }
            std::error_code ec;
            if (!std::filesystem::is_directory(root, ec)) {
                LOG_WARN("Warning: class path root does not exist: " << root.string());
            }
            result.class_path.add_root(root);
        }
    } else {
        result.class_path = ClassPath::from_environment();
    }

    if (config["url"]) {
        const auto& url = config["url"];
        result.url.connect_timeout_ms = url["connect_timeout_ms"].as<long>(result.url.connect_timeout_ms);
        result.url.timeout_ms = url["timeout_ms"].as<long>(result.url.timeout_ms);
        result.url.user_agent = url["user_agent"].as<std::string>(result.url.user_agent);
        result.url.follow_redirects = url["follow_redirects"].as<bool>(result.url.follow_redirects);
        if (result.url.connect_timeout_ms < 0 || result.url.timeout_ms < 0) {
            throw LocusError(ErrorCode::ConfigError, "url timeouts must not be negative");
        }
    }

    if (config["aliases"]) {
        for (const auto& item : config["aliases"]) {
            if (!item["prefix"] || !item["target"]) {
                throw LocusError(ErrorCode::ConfigError, "Each alias needs 'prefix' and 'target'");
            }
            result.aliases.push_back({item["prefix"].as<std::string>(), item["target"].as<std::string>()});
        }
    }

    return result;
}

namespace {

// Alias i leads to alias j when i's target starts with j's prefix
bool alias_cycle_from(const std::vector<LoaderConfig::Alias>& aliases, size_t start,
                      std::vector<int>& state) {
    state[start] = 1;
    for (size_t next = 0; next < aliases.size(); ++next) {
        if (!path_utils::starts_with(aliases[start].target, aliases[next].prefix)) {
            continue;
        }
        if (state[next] == 1) {
            return true;
        }
        if (state[next] == 0 && alias_cycle_from(aliases, next, state)) {
            return true;
        }
    }
    state[start] = 2;
    return false;
}

void check_alias_cycles(const std::vector<LoaderConfig::Alias>& aliases) {
    std::vector<int> state(aliases.size(), 0);  // 0 unvisited, 1 on stack, 2 done
    for (size_t i = 0; i < aliases.size(); ++i) {
        if (state[i] == 0 && alias_cycle_from(aliases, i, state)) {
            throw LocusError(ErrorCode::ConfigError, aliases[i].prefix,
                "Alias '" + aliases[i].prefix + "' is part of a rewrite cycle");
        }
    }
}

} // anonymous namespace

std::unique_ptr<DefaultResourceLoader> LoaderConfig::create_loader() const {
    check_alias_cycles(aliases);

    if (log_level) {
        set_log_level(*log_level);
    }

    std::unique_ptr<DefaultResourceLoader> result;
    if (loader == LoaderKind::FileSystem) {
        result = std::make_unique<FileSystemResourceLoader>(class_path, url);
    } else {
        result = std::make_unique<DefaultResourceLoader>(class_path, url);
    }

    for (const auto& alias : aliases) {
        result->add_protocol_resolver(std::make_shared<PrefixProtocolResolver>(alias.prefix, alias.target));
        LOG_VERBOSE("Alias '" << alias.prefix << "' -> '" << alias.target << "'");
    }

    LOG_INFO("Loader initialized (" << (loader == LoaderKind::FileSystem ? "filesystem" : "default")
             << ") with class path [" << class_path.to_string() << "] and "
             << aliases.size() << " alias(es)");
    return result;
}

} // namespace locus
