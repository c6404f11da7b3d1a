#include <liveview/core/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace liveview::core {

namespace {

// Konversi dari ConfigValue ke JSON
nlohmann::json configValueToJson(const ConfigValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        }
        else if constexpr (std::is_same_v<T, ConfigNodePtr>) {
            nlohmann::json obj = nlohmann::json::object();
            if (v) {
                for (const auto& [key, val] : v->values()) {
                    obj[key] = configValueToJson(val);
                }
            }
            return obj;
        }
        else if constexpr (std::is_same_v<T, ConfigArray>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : v) {
                arr.push_back(configValueToJson(item.value));
            }
            return arr;
        }
        else {
            return v;
        }
    }, value);
}

// Konversi dari JSON ke ConfigValue
ConfigValue jsonToConfigValue(const nlohmann::json& json) {
    if (json.is_null()) {
        return nullptr;
    }
    else if (json.is_boolean()) {
        return json.get<bool>();
    }
    else if (json.is_number_integer()) {
        return json.get<int64_t>();
    }
    else if (json.is_number_float()) {
        return json.get<double>();
    }
    else if (json.is_string()) {
        return json.get<std::string>();
    }
    else if (json.is_array()) {
        ConfigArray arr;
        arr.reserve(json.size());
        for (const auto& item : json) {
            arr.push_back(ConfigValueBox{jsonToConfigValue(item)});
        }
        return arr;
    }
    else if (json.is_object()) {
        ConfigNode::Map values;
        for (auto it = json.begin(); it != json.end(); ++it) {
            values[it.key()] = jsonToConfigValue(it.value());
        }
        return ConfigNode::create(std::move(values));
    }

    throw_error(ErrorCode::InvalidData, "Invalid JSON type");
}

Result<ConfigNodePtr> rootFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {ErrorCode::InvalidData, "Root configuration must be an object"};
    }

    ConfigNode::Map values;
    for (auto it = json.begin(); it != json.end(); ++it) {
        values[it.key()] = jsonToConfigValue(it.value());
    }
    return ConfigNode::create(std::move(values));
}

} // namespace

ConfigNodePtr ConfigNode::getOrCreateObject(const std::string& key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        if (auto* node = std::get_if<ConfigNodePtr>(&it->second); node && *node) {
            return *node;
        }
    }

    auto node = create();
    values_[key] = node;
    return node;
}

const ConfigValue* ConfigNode::find(std::string_view path) const {
    const ConfigNode* node = this;
    while (true) {
        auto dot = path.find('.');
        std::string key(path.substr(0, dot));

        auto it = node->values_.find(key);
        if (it == node->values_.end()) {
            return nullptr;
        }
        if (dot == std::string_view::npos) {
            return &it->second;
        }

        const auto* child = std::get_if<ConfigNodePtr>(&it->second);
        if (!child || !*child) {
            return nullptr;
        }
        node = child->get();
        path.remove_prefix(dot + 1);
    }
}

Result<void> Config::loadFromFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            return {ErrorCode::FileNotFound, "Failed to open config file: " + path.string()};
        }

        nlohmann::json json;
        file >> json;

        auto root = rootFromJson(json);
        if (!root) {
            return root.error();
        }
        root_ = root.value();
        return {};
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config file: " + std::string(e.what())};
    }
}

Result<void> Config::saveToFile(const std::filesystem::path& path) const {
    auto text = saveToString();
    if (!text) {
        return text.error();
    }

    std::ofstream file(path);
    if (!file) {
        return {ErrorCode::FileAccessDenied, "Failed to create config file: " + path.string()};
    }

    file << text.value();
    return {};
}

Result<void> Config::loadFromString(std::string_view data) {
    try {
        auto json = nlohmann::json::parse(data);

        auto root = rootFromJson(json);
        if (!root) {
            return root.error();
        }
        root_ = root.value();
        return {};
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config string: " + std::string(e.what())};
    }
}

Result<std::string> Config::saveToString() const {
    try {
        return configValueToJson(root_).dump(2);  // Indent with 2 spaces
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "Failed to serialize config: " + std::string(e.what())};
    }
}

} // namespace liveview::core
