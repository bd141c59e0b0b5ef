#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace thermal::receipt::models {

    /**
     * @brief Base interface for receipt documents exchanged as JSON
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        virtual nlohmann::json toJson() const = 0;

        /**
         * @brief Throws nlohmann::json::exception on missing or mistyped fields
         */
        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;
    };

} // namespace thermal::receipt::models
