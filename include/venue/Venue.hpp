#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <nlohmann/json.hpp>
#include "geo/Location.hpp"
#include "venue/VenueError.hpp"

namespace venue_guard {

struct TdVenue {
    TdLocation location;
    std::string title;
    std::string address;
    std::string provider;
    std::string id;
    std::string type;

    nlohmann::json to_json() const {
        return {
            {"location", location.to_json()},
            {"title", title},
            {"address", address},
            {"provider", provider},
            {"id", id},
            {"type", type}
        };
    }
};

// Venue record handed to the wire encoder.
struct InputMediaVenue {
    InputGeoPoint geo_point;
    std::string title;
    std::string address;
    std::string provider;
    std::string venue_id;
    std::string venue_type;

    nlohmann::json to_json() const {
        return {
            {"_", "inputMediaVenue"},
            {"geo_point", geo_point.to_json()},
            {"title", title},
            {"address", address},
            {"provider", provider},
            {"venue_id", venue_id},
            {"venue_type", venue_type}
        };
    }
};

struct VenueResult;

// A named place anchored to a Location. Immutable once built.
class Venue {
public:
    // Empty venue: empty location and empty strings.
    Venue() = default;

    // Unvalidated construction for data that was validated before.
    static Venue create(Location location, std::string title, std::string address,
                        std::string provider, std::string id, std::string venue_type);

    // Rejects an empty location, then cleans every string with clean_input_string.
    // Stops at the first failure; the venue is only returned on success.
    static VenueResult validate_and_create(const Location& location,
                                           std::string_view title,
                                           std::string_view address,
                                           std::string_view provider,
                                           std::string_view id,
                                           std::string_view venue_type);

    bool empty() const { return location_.is_empty(); }

    // Same real-world place: provider and id match exactly.
    bool is_same_provider_id(const Venue& other) const {
        return is_same_provider_id(other.provider_, other.id_);
    }
    bool is_same_provider_id(std::string_view provider, std::string_view id) const {
        return provider_ == provider && id_ == id;
    }

    const Location& location() const { return location_; }
    const std::string& title() const { return title_; }
    const std::string& address() const { return address_; }
    const std::string& provider() const { return provider_; }
    const std::string& id() const { return id_; }
    const std::string& venue_type() const { return venue_type_; }

    std::optional<TdVenue> to_td_venue() const;
    InputMediaVenue to_input_media_venue() const;

    bool operator==(const Venue& other) const;
    bool operator!=(const Venue& other) const { return !(*this == other); }

private:
    Venue(Location location, std::string title, std::string address,
          std::string provider, std::string id, std::string venue_type)
        : location_(std::move(location)), title_(std::move(title)), address_(std::move(address)),
          provider_(std::move(provider)), id_(std::move(id)), venue_type_(std::move(venue_type)) {}

    Location location_;
    std::string title_;
    std::string address_;
    std::string provider_;
    std::string id_;
    std::string venue_type_;
};

struct VenueResult {
    std::optional<Venue> venue;   // set iff success
    VenueError error = VenueError::NONE;
    std::string reason;
    bool success = false;
};

}
