// include/chain_risk/data/chain_loader.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "chain_risk/core/error.hpp"
#include "chain_risk/core/types.hpp"

namespace chain_risk {

/**
 * @brief Reads exchange option-chain documents into ChainSnapshots
 *
 * Expected layout:
 *   { "data":   { "lastTrade": "...", "table": { "rows": [ {...}, ... ] } },
 *     "status": { "rCode": 200, "bCodeMessage": ... } }
 *
 * Row keys: strike, c_Last, c_Bid, c_Ask, c_Volume, c_Openinterest, p_Last,
 * p_Bid, p_Ask, p_Volume, p_Openinterest, expiryDate, expirygroup. Missing
 * or null fields become empty strings; numeric JSON values are kept as text.
 * The snapshot's expiry_date is the first row expiryDate in "YYYY-MM-DD" form,
 * or empty when no row carries one.
 */
class ChainLoader {
public:
    /**
     * @brief Convert an already parsed document
     * @param document Exchange response
     * @param symbol Underlying symbol stored on the snapshot
     * @return Snapshot, API_ERROR for a non-200 status code, INVALID_DATA when
     *         the data section is missing
     */
    static Result<ChainSnapshot> from_json(const nlohmann::json& document,
                                           const std::string& symbol = "");

    /**
     * @brief Parse a document held in memory
     * @return JSON_PARSE_ERROR for malformed text, otherwise as from_json
     */
    static Result<ChainSnapshot> parse(const std::string& text, const std::string& symbol = "");

    /**
     * @brief Read and parse a document from disk
     * @return FILE_NOT_FOUND if the file cannot be opened, otherwise as parse
     */
    static Result<ChainSnapshot> load_file(const std::filesystem::path& file_path,
                                           const std::string& symbol = "");
};

}  // namespace chain_risk
