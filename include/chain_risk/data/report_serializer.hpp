// include/chain_risk/data/report_serializer.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "chain_risk/core/error.hpp"
#include "chain_risk/options/analysis_result.hpp"

namespace chain_risk {

/**
 * @brief Writes analysis results as JSON reports
 */
class ReportSerializer {
public:
    /**
     * @brief Build the report document
     *
     * Field names follow the published report layout (current_price,
     * risk_neutral_probabilities.prob_gain_0pct_plus, ...).
     *
     * @param result Analysis output
     * @param timestamp ISO-8601 report time; the current UTC time when empty
     */
    static nlohmann::json to_json(const options::RiskAnalysisResult& result,
                                  const std::string& timestamp = "");

    /**
     * @brief Write the report to disk, pretty-printed
     * @return FILE_IO_ERROR when the file cannot be written
     */
    static Result<void> save_to_file(const options::RiskAnalysisResult& result,
                                     const std::filesystem::path& file_path);
};

}  // namespace chain_risk
