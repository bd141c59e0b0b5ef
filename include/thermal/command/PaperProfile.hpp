#pragma once

#include <string>
#include <optional>

namespace thermal::command {

    enum class PaperProfile {
        Narrow, // 58mm
        Wide    // 80mm
    };

    /**
     * @brief Accepts "58mm"/"narrow" and "80mm"/"wide", case-insensitive.
     */
    std::optional<PaperProfile> parsePaperProfile(const std::string &value);

    std::string paperProfileToString(PaperProfile profile);

}
