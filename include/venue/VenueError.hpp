#pragma once
#include <string>

namespace venue_guard {

enum class VenueError {
    NONE,
    INVALID_LOCATION,
    INVALID_TITLE,
    INVALID_ADDRESS,
    INVALID_PROVIDER,
    INVALID_ID,
    INVALID_TYPE
};

inline std::string venue_error_to_string(VenueError e) {
    switch (e) {
        case VenueError::NONE: return "NONE";
        case VenueError::INVALID_LOCATION: return "INVALID_LOCATION";
        case VenueError::INVALID_TITLE: return "INVALID_TITLE";
        case VenueError::INVALID_ADDRESS: return "INVALID_ADDRESS";
        case VenueError::INVALID_PROVIDER: return "INVALID_PROVIDER";
        case VenueError::INVALID_ID: return "INVALID_ID";
        case VenueError::INVALID_TYPE: return "INVALID_TYPE";
    }
    return "UNKNOWN";
}

}
