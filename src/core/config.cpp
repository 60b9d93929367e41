#include "ptrack/core/config.hpp"
#include "ptrack/core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace ptrack {

// ============================================================================
// Implementation details
// ============================================================================

struct Config::Impl {
    YAML::Node root;

    YAML::Node navigate(const std::string& key) const {
        std::vector<std::string> parts;
        std::stringstream ss(key);
        std::string part;
        while (std::getline(ss, part, '.')) {
            parts.push_back(part);
        }

        // yaml-cpp's operator[] can insert into the tree even through a
        // const node, so walk a clone
        YAML::Node current = YAML::Clone(root);

        for (const auto& p : parts) {
            if (!current || !current.IsMap()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            if (!current[p]) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current = current[p];
        }

        return current;
    }

    template<typename T>
    std::optional<T> scalar(const std::string& key) const {
        try {
            auto node = navigate(key);
            if (node && node.IsScalar()) {
                return node.as<T>();
            }
        } catch (const YAML::Exception& e) {
            PTRACK_LOG_WARN("config", "Bad value for '{}': {}", key, e.what());
        }
        return std::nullopt;
    }
};

namespace {

template<typename T, typename Parse>
std::optional<T> parse_override(const std::string& key, const std::string& text, Parse parse) {
    try {
        return parse(text);
    } catch (const std::exception& e) {
        PTRACK_LOG_WARN("config", "Ignoring override {}={}: {}", key, text, e.what());
        return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// Config Implementation
// ============================================================================

Config::Config() = default;
Config::~Config() = default;

bool Config::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::LoadFile(path);
        impl_ = std::move(impl);
        file_path_ = path;

        PTRACK_LOG_INFO("config", "Loaded configuration from: {}", path);
        return true;
    } catch (const YAML::Exception& e) {
        PTRACK_LOG_ERROR("config", "Failed to load config from {}: {}", path, e.what());
        return false;
    }
}

const std::string* Config::find_override(const std::string& key) const {
    auto it = overrides_.find(key);
    return it != overrides_.end() ? &it->second : nullptr;
}

std::string Config::get_string(const std::string& key,
                               const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* ov = find_override(key)) {
        return *ov;
    }
    if (!impl_) return default_value;

    return impl_->scalar<std::string>(key).value_or(default_value);
}

int Config::get_int(const std::string& key, int default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* ov = find_override(key)) {
        auto v = parse_override<int>(key, *ov, [](const std::string& s) { return std::stoi(s); });
        if (v) return *v;
    }
    if (!impl_) return default_value;

    return impl_->scalar<int>(key).value_or(default_value);
}

float Config::get_float(const std::string& key, float default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* ov = find_override(key)) {
        auto v = parse_override<float>(key, *ov, [](const std::string& s) { return std::stof(s); });
        if (v) return *v;
    }
    if (!impl_) return default_value;

    return impl_->scalar<float>(key).value_or(default_value);
}

double Config::get_double(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* ov = find_override(key)) {
        auto v = parse_override<double>(key, *ov, [](const std::string& s) { return std::stod(s); });
        if (v) return *v;
    }
    if (!impl_) return default_value;

    return impl_->scalar<double>(key).value_or(default_value);
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* ov = find_override(key)) {
        std::string val = *ov;
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return val == "true" || val == "1" || val == "yes";
    }
    if (!impl_) return default_value;

    return impl_->scalar<bool>(key).value_or(default_value);
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    if (!impl_) return result;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsSequence()) {
            for (const auto& item : node) {
                result.push_back(item.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        PTRACK_LOG_WARN("config", "Bad list for '{}': {}", key, e.what());
        result.clear();
    }

    return result;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (find_override(key)) {
        return true;
    }
    if (!impl_) return false;

    auto node = impl_->navigate(key);
    return node && node.IsDefined();
}

void Config::override(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = value;
}

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) != "--") {
            continue;
        }

        arg = arg.substr(2);
        auto eq_pos = arg.find('=');

        std::string key, value;

        if (eq_pos != std::string::npos) {
            key = arg.substr(0, eq_pos);
            value = arg.substr(eq_pos + 1);
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            // Boolean flag
            key = arg;
            value = "true";
        }

        // Dashes address nested keys: --tracker-min_hits == --tracker.min_hits
        std::replace(key.begin(), key.end(), '-', '.');

        override(key, value);
        PTRACK_LOG_DEBUG("config", "Config override: {} = {}", key, value);
    }
}

}  // namespace ptrack
