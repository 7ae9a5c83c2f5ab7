#include "trebuchet/diagnostics/diagnostic.h"
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <string_view>

namespace trebuchet::diagnostics {
    static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
        if (lhs.size() != rhs.size()) { return false; }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
                std::tolower(static_cast<unsigned char>(rhs[i]))) { return false; }
        }
        return true;
    }

    bool UseEnvColor() {
        const char *env_value = std::getenv("TREBUCHET_COLOR");
        if (env_value == nullptr) { return false; }
        static constexpr std::array<std::string_view, 3> kTruthy{"1", "true", "yes"};
        for (const auto truthy : kTruthy) {
            if (equals_ci(env_value, truthy)) { return true; }
        }
        return false;
    }
} // namespace trebuchet::diagnostics
