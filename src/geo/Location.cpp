#include "geo/Location.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace venue_guard {

Location Location::from_components(double latitude, double longitude,
                                   double horizontal_accuracy, int64_t access_hash) {
    if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
        std::abs(latitude) > 90 || std::abs(longitude) > 180) {
        spdlog::trace("Location ({}, {}) out of range, using empty location", latitude, longitude);
        return Location();
    }
    return Location(latitude, longitude, fix_accuracy(horizontal_accuracy), access_hash);
}

double Location::fix_accuracy(double accuracy) {
    if (!std::isfinite(accuracy) || accuracy <= 0.0) {
        return 0.0;
    }
    if (accuracy >= MAX_HORIZONTAL_ACCURACY) {
        return MAX_HORIZONTAL_ACCURACY;
    }
    return accuracy;
}

bool Location::is_valid_map_point() const {
    return !is_empty_ && std::abs(latitude_) <= MAX_VALID_MAP_LATITUDE;
}

std::optional<TdLocation> Location::to_td_location() const {
    if (is_empty_) {
        return std::nullopt;
    }
    return TdLocation{latitude_, longitude_, horizontal_accuracy_};
}

InputGeoPoint Location::to_input_geo_point() const {
    InputGeoPoint point;
    if (is_empty_) {
        return point;
    }

    point.empty = false;
    point.lat = latitude_;
    point.lon = longitude_;
    if (horizontal_accuracy_ > 0) {
        point.flags |= ACCURACY_RADIUS_MASK;
        point.accuracy_radius = static_cast<int32_t>(std::ceil(horizontal_accuracy_));
    }
    return point;
}

bool Location::operator==(const Location& other) const {
    return is_empty_ == other.is_empty_ &&
           latitude_ == other.latitude_ &&
           longitude_ == other.longitude_ &&
           horizontal_accuracy_ == other.horizontal_accuracy_ &&
           access_hash_ == other.access_hash_;
}

nlohmann::json InputGeoPoint::to_json() const {
    if (empty) {
        return {{"_", "inputGeoPointEmpty"}};
    }
    nlohmann::json j = {
        {"_", "inputGeoPoint"},
        {"flags", flags},
        {"lat", lat},
        {"long", lon}
    };
    if (accuracy_radius) {
        j["accuracy_radius"] = *accuracy_radius;
    }
    return j;
}

}
