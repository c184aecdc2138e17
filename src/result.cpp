#include <bridgegrader/result.hpp>

#include <string_view>

namespace bridgegrader {

std::string_view CaseResult::flag_code(Flag flag) noexcept {
    switch (flag) {
    case AC:
        return "AC";
    case WA:
        return "WA";
    case RTE:
        return "RTE";
    case TLE:
        return "TLE";
    case MLE:
        return "MLE";
    case IR:
        return "IR";
    case OLE:
        return "OLE";
    case IE:
        return "IE";
    }

    return "??";
}

std::string_view CaseResult::get_main_code() const noexcept {
    for (Flag flag : FLAG_PRECEDENCE) {
        if ((result_flag & flag) != 0U) {
            return flag_code(flag);
        }
    }

    return flag_code(AC);
}

} // namespace bridgegrader
