#include "bayerflow/core/types.hpp"

namespace bayerflow {
namespace core {

std::string cfaPatternToString(CfaPattern pattern) {
    switch (pattern) {
        case CfaPattern::RGGB: return "RGGB";
        case CfaPattern::GRBG: return "GRBG";
        case CfaPattern::GBRG: return "GBRG";
        case CfaPattern::BGGR: return "BGGR";
        default:               return "UNKNOWN";
    }
}

std::string divisionModeToString(DivisionMode mode) {
    switch (mode) {
        case DivisionMode::APPROXIMATE: return "approximate";
        case DivisionMode::EXACT:       return "exact";
        default:                        return "unknown";
    }
}

} // namespace core
} // namespace bayerflow
