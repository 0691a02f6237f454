// include/chain_risk/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "chain_risk/core/error.hpp"

namespace chain_risk {

/**
 * @brief JSON-backed settings block
 *
 * Subclasses map their fields to JSON; file I/O and its error reporting live here.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to filepath, pretty-printed
     * @return FILE_IO_ERROR when the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Parse filepath and apply it with from_json()
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, or UNKNOWN_ERROR for a mistyped value
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from; absent keys keep their current values
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace chain_risk
