#include "KeyValueStore.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace mcpline {

KeyValueStore::KeyValueStore(std::map<std::string, json> entries)
    : entries_(std::move(entries)) {}

KeyValueStore KeyValueStore::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open key-value file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in key-value file " + path.string() + ": " + e.what());
    }

    if (!document.is_object()) {
        throw std::runtime_error("Key-value file must contain a JSON object: " + path.string());
    }

    std::map<std::string, json> entries;
    for (auto it = document.begin(); it != document.end(); ++it) {
        entries.emplace(it.key(), it.value());
    }

    spdlog::info("Loaded {} key-value entries from {}", entries.size(), path.string());
    return KeyValueStore(std::move(entries));
}

std::optional<json> KeyValueStore::lookup(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> KeyValueStore::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace mcpline
