#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpline {

using json = nlohmann::json;

/**
 * @brief Read-only key to JSON value lookup table
 */
class KeyValueStore {
public:
    KeyValueStore() = default;

    explicit KeyValueStore(std::map<std::string, json> entries);

    /**
     * @brief Load store from a file holding one JSON object
     *
     * @param path File path
     * @return Store with one entry per top-level member
     * @throws std::runtime_error if the file cannot be read or is not a JSON object
     */
    static KeyValueStore load_file(const std::filesystem::path& path);

    std::optional<json> lookup(const std::string& key) const;

    /**
     * @brief All keys, sorted
     */
    std::vector<std::string> keys() const;

    std::size_t size() const { return entries_.size(); }

private:
    std::map<std::string, json> entries_;
};

} // namespace mcpline
