#include "venue/Venue.hpp"
#include <array>
#include <spdlog/spdlog.h>
#include "utils/Scrubber.hpp"

namespace venue_guard {

namespace {

struct FieldRule {
    const char* name;
    std::string_view input;
    VenueError error;
    std::string* output;
};

VenueResult reject(VenueError error, std::string reason) {
    spdlog::debug("Venue rejected: {} ({})", venue_error_to_string(error), reason);
    VenueResult result;
    result.error = error;
    result.reason = std::move(reason);
    return result;
}

}

Venue Venue::create(Location location, std::string title, std::string address,
                    std::string provider, std::string id, std::string venue_type) {
    return Venue(std::move(location), std::move(title), std::move(address),
                 std::move(provider), std::move(id), std::move(venue_type));
}

VenueResult Venue::validate_and_create(const Location& location,
                                       std::string_view title,
                                       std::string_view address,
                                       std::string_view provider,
                                       std::string_view id,
                                       std::string_view venue_type) {
    if (location.is_empty()) {
        return reject(VenueError::INVALID_LOCATION, "Venue must be non-empty");
    }

    std::string clean_title, clean_address, clean_provider, clean_id, clean_type;
    const std::array<FieldRule, 5> fields = {{
        {"title", title, VenueError::INVALID_TITLE, &clean_title},
        {"address", address, VenueError::INVALID_ADDRESS, &clean_address},
        {"provider", provider, VenueError::INVALID_PROVIDER, &clean_provider},
        {"id", id, VenueError::INVALID_ID, &clean_id},
        {"type", venue_type, VenueError::INVALID_TYPE, &clean_type}
    }};

    for (const auto& field : fields) {
        auto cleaned = clean_input_string(field.input);
        if (!cleaned) {
            return reject(field.error, std::string("Venue ") + field.name + ": Strings must be encoded in UTF-8");
        }
        *field.output = std::move(*cleaned);
    }

    VenueResult result;
    result.venue = Venue(location, std::move(clean_title), std::move(clean_address),
                         std::move(clean_provider), std::move(clean_id), std::move(clean_type));
    result.success = true;
    return result;
}

std::optional<TdVenue> Venue::to_td_venue() const {
    auto td_location = location_.to_td_location();
    if (!td_location) {
        return std::nullopt;
    }
    return TdVenue{*td_location, title_, address_, provider_, id_, venue_type_};
}

InputMediaVenue Venue::to_input_media_venue() const {
    return {location_.to_input_geo_point(), title_, address_, provider_, id_, venue_type_};
}

bool Venue::operator==(const Venue& other) const {
    return location_ == other.location_ &&
           title_ == other.title_ &&
           address_ == other.address_ &&
           provider_ == other.provider_ &&
           id_ == other.id_ &&
           venue_type_ == other.venue_type_;
}

}
