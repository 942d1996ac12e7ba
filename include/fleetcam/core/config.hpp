#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

#include <fleetcam/core/error.hpp>

namespace fleetcam::core {

// Forward declarations
class ConfigNode;
struct ConfigValue;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;
using ConfigArray = std::vector<ConfigValue>;

// Tipe nilai yang didukung dalam konfigurasi
using ConfigVariant = std::variant<
    std::nullptr_t,    // Untuk nilai null
    bool,              // Untuk nilai boolean
    int64_t,           // Untuk nilai integer
    double,            // Untuk nilai floating point
    std::string,       // Untuk nilai string
    ConfigArray,       // Untuk array
    ConfigNodePtr      // Untuk object/nested config
>;

// Recursive variant; a named struct so ConfigArray can refer to it
struct ConfigValue : ConfigVariant {
    using ConfigVariant::ConfigVariant;
    using ConfigVariant::operator=;

    const ConfigVariant& variant() const noexcept { return *this; }
};

// Class untuk node konfigurasi
class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    // Constructors
    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    // Factory methods
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

        if (const T* value = std::get_if<T>(&it->second.variant())) {
            return *value;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    // Nilai dengan default bila key tidak ada; tipe yang salah tetap error
    template<typename T>
    Result<T> getOr(const std::string& key, T fallback) const {
        if (!has(key)) {
            return fallback;
        }
        return get<T>(key);
    }

    // Set nilai
    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    // Cek keberadaan key
    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    // Hapus key
    void remove(const std::string& key) {
        values_.erase(key);
    }

    // Akses nested config
    Result<ConfigNodePtr> getObject(const std::string& key) const {
        return get<ConfigNodePtr>(key);
    }

    // Buat atau dapat nested config
    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (const auto* node = std::get_if<ConfigNodePtr>(&it->second.variant())) {
                return *node;
            }
        }

        auto node = create();
        values_[key] = node;
        return node;
    }

    // Iterasi
    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    Map values_;
};

// Class utama untuk konfigurasi
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    // Mencegah copy dan move
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    // Load dari file
    Result<void> loadFromFile(const std::filesystem::path& path);

    // Save ke file
    Result<void> saveToFile(const std::filesystem::path& path) const;

    // Load dari string
    Result<void> loadFromString(std::string_view data);

    // Save ke string
    Result<std::string> saveToString() const;

    // Akses root node
    ConfigNodePtr root() { return root_; }
    const ConfigNodePtr root() const { return root_; }

    // Helper untuk akses langsung ke nilai
    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
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

    // Reset konfigurasi
    void clear() {
        root_ = ConfigNode::create();
    }

private:
    Config() : root_(ConfigNode::create()) {}
    ConfigNodePtr root_;
};

// Helper untuk akses global config
inline Config& config() {
    return Config::instance();
}

} // namespace fleetcam::core
