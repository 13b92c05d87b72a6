#include "tools/BatchChecker.hpp"
#include <spdlog/spdlog.h>

namespace venue_guard {

nlohmann::json BatchChecker::malformed(size_t line_no, const std::string& reason) {
    summary_.malformed++;
    spdlog::warn("⚠️ Line {}: malformed record: {}", line_no, reason);
    return {{"line", line_no}, {"status", "malformed"}, {"reason", reason}};
}

nlohmann::json BatchChecker::check_line(const std::string& line, size_t line_no) {
    summary_.total++;

    RawVenueRecord record;
    try {
        auto j = nlohmann::json::parse(line);
        if (!j.is_object()) {
            return malformed(line_no, "record must be a JSON object");
        }
        record = RawVenueRecord::from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return malformed(line_no, e.what());
    } catch (const std::invalid_argument& e) {
        return malformed(line_no, e.what());
    }

    return check_record(record, line_no);
}

nlohmann::json BatchChecker::check_record(const RawVenueRecord& record, size_t line_no) {
    auto location = Location::from_components(record.latitude, record.longitude,
                                              record.horizontal_accuracy, record.access_hash);
    auto result = Venue::validate_and_create(location, record.title, record.address,
                                             record.provider, record.id, record.type);
    if (!result.success) {
        summary_.rejected++;
        return {
            {"line", line_no},
            {"status", "rejected"},
            {"error", venue_error_to_string(result.error)},
            {"reason", result.reason}
        };
    }

    const Venue& venue = *result.venue;
    if (config_.require_map_point && !venue.location().is_valid_map_point()) {
        summary_.rejected++;
        return {
            {"line", line_no},
            {"status", "rejected"},
            {"error", "NOT_A_MAP_POINT"},
            {"reason", "Latitude is beyond the map projection limit"}
        };
    }

    nlohmann::json j = {
        {"line", line_no},
        {"status", "ok"},
        {"input_media_venue", venue.to_input_media_venue().to_json()}
    };
    if (auto td = venue.to_td_venue()) {
        j["venue"] = td->to_json();
    }

    // A venue without an external id names no known place.
    if (!venue.provider().empty() || !venue.id().empty()) {
        auto inserted = first_seen_.emplace(std::make_pair(venue.provider(), venue.id()), line_no);
        if (!inserted.second) {
            j["same_place_as"] = inserted.first->second;
            summary_.duplicates++;
        }
    }

    summary_.accepted++;
    return j;
}

BatchSummary BatchChecker::run(std::istream& in, std::ostream& out) {
    const int indent = config_.pretty ? 2 : -1;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        // Parser messages may quote raw input bytes, which need not be UTF-8.
        out << check_line(line, line_no).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    }

    spdlog::info("📊 Checked {} records: {} accepted, {} rejected, {} malformed, {} duplicates",
                 summary_.total, summary_.accepted, summary_.rejected,
                 summary_.malformed, summary_.duplicates);
    return summary_;
}

}
