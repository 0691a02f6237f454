// src/data/chain_loader.cpp

#include "chain_risk/data/chain_loader.hpp"

#include <fstream>
#include <sstream>

#include "chain_risk/core/logger.hpp"
#include "chain_risk/core/time_utils.hpp"

namespace chain_risk {

namespace {

constexpr int STATUS_OK = 200;

std::string field_text(const nlohmann::json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) {
        return "";
    }
    const auto& value = object.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::string status_message(const nlohmann::json& status) {
    if (!status.contains("bCodeMessage")) {
        return "";
    }
    const auto& message = status.at("bCodeMessage");
    if (message.is_string()) {
        return message.get<std::string>();
    }
    if (message.is_null()) {
        return "";
    }
    return message.dump();
}

RawQuoteRow row_from_json(const nlohmann::json& j) {
    RawQuoteRow row;
    row.strike = field_text(j, "strike");

    row.call_last = field_text(j, "c_Last");
    row.call_bid = field_text(j, "c_Bid");
    row.call_ask = field_text(j, "c_Ask");
    row.call_volume = field_text(j, "c_Volume");
    row.call_open_interest = field_text(j, "c_Openinterest");

    row.put_last = field_text(j, "p_Last");
    row.put_bid = field_text(j, "p_Bid");
    row.put_ask = field_text(j, "p_Ask");
    row.put_volume = field_text(j, "p_Volume");
    row.put_open_interest = field_text(j, "p_Openinterest");

    row.expiry_group = field_text(j, "expirygroup");
    row.expiry_date = field_text(j, "expiryDate");
    return row;
}

}  // anonymous namespace

Result<ChainSnapshot> ChainLoader::from_json(const nlohmann::json& document,
                                             const std::string& symbol) {
    if (!document.is_object()) {
        return make_error<ChainSnapshot>(ErrorCode::INVALID_DATA,
                                         "Option chain document must be a JSON object",
                                         "ChainLoader");
    }

    if (document.contains("status") && document.at("status").is_object()) {
        const auto& status = document.at("status");
        if (status.contains("rCode") && status.at("rCode").is_number_integer()) {
            int code = status.at("rCode").get<int>();
            if (code != STATUS_OK) {
                return make_error<ChainSnapshot>(
                    ErrorCode::API_ERROR,
                    "Option chain request failed with status " + std::to_string(code) + ": " +
                        status_message(status),
                    "ChainLoader");
            }
        }
    }

    if (!document.contains("data") || !document.at("data").is_object()) {
        return make_error<ChainSnapshot>(ErrorCode::INVALID_DATA,
                                         "Option chain document has no data section",
                                         "ChainLoader");
    }

    const auto& data = document.at("data");
    ChainSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.last_trade = field_text(data, "lastTrade");

    if (data.contains("table") && data.at("table").is_object()) {
        const auto& table = data.at("table");
        if (table.contains("rows") && table.at("rows").is_array()) {
            const auto& rows = table.at("rows");
            snapshot.rows.reserve(rows.size());
            for (const auto& row : rows) {
                snapshot.rows.push_back(row_from_json(row));
                // Some feeds only give "Dec 18"; keep the first calendar date
                const std::string& expiry = snapshot.rows.back().expiry_date;
                if (snapshot.expiry_date.empty() && !expiry.empty() &&
                    core::parse_date_utc(expiry).is_ok()) {
                    snapshot.expiry_date = expiry;
                }
            }
        }
    }

    DEBUG("Loaded option chain " << (symbol.empty() ? "<unnamed>" : symbol) << " with "
                                 << snapshot.rows.size() << " rows"
                                 << (snapshot.expiry_date.empty() ? ""
                                                                  : ", expiry " + snapshot.expiry_date));
    return snapshot;
}

Result<ChainSnapshot> ChainLoader::parse(const std::string& text, const std::string& symbol) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<ChainSnapshot>(ErrorCode::JSON_PARSE_ERROR,
                                         std::string("Failed to parse option chain: ") + e.what(),
                                         "ChainLoader");
    }
    return from_json(document, symbol);
}

Result<ChainSnapshot> ChainLoader::load_file(const std::filesystem::path& file_path,
                                             const std::string& symbol) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<ChainSnapshot>(ErrorCode::FILE_NOT_FOUND,
                                         "Failed to open option chain file: " + file_path.string(),
                                         "ChainLoader");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_error<ChainSnapshot>(ErrorCode::FILE_IO_ERROR,
                                         "Error reading option chain file: " + file_path.string(),
                                         "ChainLoader");
    }
    return parse(buffer.str(), symbol);
}

}  // namespace chain_risk
