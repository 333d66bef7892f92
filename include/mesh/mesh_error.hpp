#ifndef WAVEMESH_MESH_ERROR_HPP
#define WAVEMESH_MESH_ERROR_HPP

#include <ostream>

namespace wavemesh {

enum class MeshError {
    SUCCESS = 0,
    UNKNOWN_NODE,
    UNKNOWN_FILE,
    DUPLICATE_NODE,
    INVALID_LINK,
    NO_ROUTE,
    NO_SOURCE,
    CACHE_FULL,
    CAPACITY_VIOLATION,
    INVALID_NODE
};

inline const char* mesh_error_to_string(MeshError error) {
    switch (error) {
        case MeshError::SUCCESS: return "Success";
        case MeshError::UNKNOWN_NODE: return "Unknown node";
        case MeshError::UNKNOWN_FILE: return "Unknown file";
        case MeshError::DUPLICATE_NODE: return "Duplicate node";
        case MeshError::INVALID_LINK: return "Invalid link";
        case MeshError::NO_ROUTE: return "No route";
        case MeshError::NO_SOURCE: return "No source";
        case MeshError::CACHE_FULL: return "Cache full";
        case MeshError::CAPACITY_VIOLATION: return "Capacity violation";
        case MeshError::INVALID_NODE: return "Invalid node";
        default: return "Undefined error";
    }
}

inline std::ostream& operator<<(std::ostream& os, MeshError error) {
    return os << mesh_error_to_string(error);
}

} // namespace wavemesh

#endif // WAVEMESH_MESH_ERROR_HPP
