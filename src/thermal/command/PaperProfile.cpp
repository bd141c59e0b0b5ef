#include "thermal/command/PaperProfile.hpp"
#include <algorithm>
#include <cctype>

namespace thermal::command {

    std::optional<PaperProfile> parsePaperProfile(const std::string &value) {
        std::string key = value;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "58mm" || key == "58" || key == "narrow") return PaperProfile::Narrow;
        if (key == "80mm" || key == "80" || key == "wide") return PaperProfile::Wide;
        return std::nullopt;
    }

    std::string paperProfileToString(PaperProfile profile) {
        switch (profile) {
            case PaperProfile::Narrow:
                return "58mm";
            case PaperProfile::Wide:
                return "80mm";
            default:
                return "unknown";
        }
    }

}
