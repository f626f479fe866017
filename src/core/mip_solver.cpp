#include "str8ts/mip_solver.hpp"

namespace str8ts {

const char* to_string(MipStatus status) {
    switch (status) {
        case MipStatus::Optimal: return "optimal";
        case MipStatus::Infeasible: return "infeasible";
        case MipStatus::Limit: return "limit";
        case MipStatus::Unknown: return "unknown";
        case MipStatus::Error: return "error";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, MipStatus status) {
    return os << to_string(status);
}

} // namespace str8ts
