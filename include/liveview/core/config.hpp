#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <filesystem>

#include <liveview/core/error.hpp>

namespace liveview::core {

class ConfigNode;
struct ConfigValueBox;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;

// Tipe nilai yang didukung dalam konfigurasi
using ConfigValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    std::vector<ConfigValueBox>,
    ConfigNodePtr
>;

// Array elements need an indirection because ConfigValue cannot name itself.
struct ConfigValueBox {
    ConfigValue value;
};

using ConfigArray = std::vector<ConfigValueBox>;

class ConfigNode {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    // Akses nilai
    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::ResourceNotFound, "Configuration key not found: " + key};
        }
        return convert<T>(key, it->second);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    // Buat atau dapat nested config
    ConfigNodePtr getOrCreateObject(const std::string& key);

    // Lookup "a.b.c" through nested objects.
    const ConfigValue* find(std::string_view path) const;

    const Map& values() const { return values_; }
    Map& values() { return values_; }

    template<typename T>
    static Result<T> convert(const std::string& key, const ConfigValue& value) {
        if constexpr (std::is_same_v<T, double>) {
            // Integers are accepted where a double is expected
            if (const auto* i = std::get_if<int64_t>(&value)) {
                return static_cast<double>(*i);
            }
        }
        if (const auto* v = std::get_if<T>(&value)) {
            return *v;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

private:
    Map values_;
};

class Config {
public:
    Config() : root_(ConfigNode::create()) {}

    static Config& instance() {
        static Config instance;
        return instance;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    const ConfigNodePtr root() const { return root_; }

    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
    }

    // Dotted-path lookup, e.g. getPath<int64_t>("session.requestTimeoutMs")
    template<typename T>
    Result<T> getPath(const std::string& path) const {
        const ConfigValue* value = root_->find(path);
        if (!value) {
            return {ErrorCode::ResourceNotFound, "Configuration key not found: " + path};
        }
        return ConfigNode::convert<T>(path, *value);
    }

    bool hasPath(const std::string& path) const {
        return root_->find(path) != nullptr;
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    ConfigNodePtr root_;
};

inline Config& config() {
    return Config::instance();
}

} // namespace liveview::core
