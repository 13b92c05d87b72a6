#pragma once
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "ConfigManager.hpp"
#include "venue/Venue.hpp"

namespace venue_guard {

// One input line as decoded from the feed, before any validation.
struct RawVenueRecord {
    double latitude = std::numeric_limits<double>::quiet_NaN();
    double longitude = std::numeric_limits<double>::quiet_NaN();
    double horizontal_accuracy = 0.0;
    int64_t access_hash = 0;
    std::string title;
    std::string address;
    std::string provider;
    std::string id;
    std::string type;

    // Throws nlohmann::json::exception on a field of the wrong type and
    // std::invalid_argument on an access_hash that is not a signed 64-bit integer.
    static RawVenueRecord from_json(const nlohmann::json& j) {
        RawVenueRecord r;
        r.latitude = j.value("latitude", r.latitude);
        r.longitude = j.value("longitude", r.longitude);
        r.horizontal_accuracy = j.value("horizontal_accuracy", r.horizontal_accuracy);
        if (j.contains("access_hash")) {
            const auto& hash = j["access_hash"];
            if (!hash.is_number_integer()) {
                throw std::invalid_argument("access_hash must be an integer");
            }
            if (hash.is_number_unsigned() &&
                hash.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw std::invalid_argument("access_hash is out of range");
            }
            r.access_hash = hash.get<int64_t>();
        }
        r.title = j.value("title", "");
        r.address = j.value("address", "");
        r.provider = j.value("provider", "");
        r.id = j.value("id", "");
        r.type = j.value("type", "");
        return r;
    }
};

struct BatchSummary {
    size_t total = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t malformed = 0;
    size_t duplicates = 0;

    nlohmann::json to_json() const {
        return {
            {"total", total},
            {"accepted", accepted},
            {"rejected", rejected},
            {"malformed", malformed},
            {"duplicates", duplicates}
        };
    }
};

// Validates a JSON Lines venue feed and writes one result record per input line.
class BatchChecker {
public:
    explicit BatchChecker(CheckerConfig config) : config_(std::move(config)) {}

    // Result record for a single line; `line_no` is 1-based.
    nlohmann::json check_line(const std::string& line, size_t line_no);

    BatchSummary run(std::istream& in, std::ostream& out);

    const BatchSummary& summary() const { return summary_; }

private:
    CheckerConfig config_;
    BatchSummary summary_;
    // (provider, id) -> line of the first accepted venue carrying it
    std::map<std::pair<std::string, std::string>, size_t> first_seen_;

    nlohmann::json check_record(const RawVenueRecord& record, size_t line_no);
    nlohmann::json malformed(size_t line_no, const std::string& reason);
};

}
