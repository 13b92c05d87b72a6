#pragma once
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace venue_guard {

// Mercator projection limit. Points beyond it are valid but can't be drawn on web maps.
constexpr double MAX_VALID_MAP_LATITUDE = 85.05112877;

// Server-side limit, in meters.
constexpr double MAX_HORIZONTAL_ACCURACY = 1500.0;

// inputGeoPoint flag: accuracy_radius is present.
constexpr int32_t ACCURACY_RADIUS_MASK = 1 << 0;

struct TdLocation {
    double latitude = 0.0;
    double longitude = 0.0;
    double horizontal_accuracy = 0.0;

    nlohmann::json to_json() const {
        return {
            {"latitude", latitude},
            {"longitude", longitude},
            {"horizontal_accuracy", horizontal_accuracy}
        };
    }
};

// Map point record handed to the wire encoder.
struct InputGeoPoint {
    bool empty = true;
    int32_t flags = 0;
    double lat = 0.0;
    double lon = 0.0;
    std::optional<int32_t> accuracy_radius;

    nlohmann::json to_json() const;
};

// A geographic point. Either empty, or finite coordinates within
// [-90, 90] x [-180, 180] with accuracy clamped to [0, 1500].
// Only constructible through the factories below; immutable afterwards.
class Location {
public:
    // The empty sentinel.
    Location() = default;

    static Location empty() { return Location(); }

    // Never fails: non-finite or out-of-range coordinates yield the empty sentinel.
    static Location from_components(double latitude, double longitude,
                                    double horizontal_accuracy, int64_t access_hash);

    // TD API locations carry no access hash.
    static Location from_td_location(double latitude, double longitude, double horizontal_accuracy) {
        return from_components(latitude, longitude, horizontal_accuracy, 0);
    }

    // Non-finite or non-positive -> 0, >= 1500 -> 1500.
    static double fix_accuracy(double accuracy);

    bool is_empty() const { return is_empty_; }
    bool is_valid_map_point() const;

    double latitude() const { return latitude_; }
    double longitude() const { return longitude_; }
    double horizontal_accuracy() const { return horizontal_accuracy_; }
    int64_t access_hash() const { return access_hash_; }

    std::optional<TdLocation> to_td_location() const;
    InputGeoPoint to_input_geo_point() const;

    bool operator==(const Location& other) const;
    bool operator!=(const Location& other) const { return !(*this == other); }

private:
    Location(double latitude, double longitude, double horizontal_accuracy, int64_t access_hash)
        : is_empty_(false), latitude_(latitude), longitude_(longitude),
          horizontal_accuracy_(horizontal_accuracy), access_hash_(access_hash) {}

    bool is_empty_ = true;
    double latitude_ = 0.0;
    double longitude_ = 0.0;
    double horizontal_accuracy_ = 0.0;
    int64_t access_hash_ = 0;
};

}
