//
// Created by redeg on 26/04/2025.
//

#pragma once

#include "thermal/types/Bytes.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace thermal::link {

    enum class WriteStatus {
        Ok,
        Rejected,
        TimedOut,
        Disconnected
    };

    inline std::string writeStatusToString(WriteStatus status) {
        switch (status) {
            case WriteStatus::Ok: return "Ok";
            case WriteStatus::Rejected: return "Rejected";
            case WriteStatus::TimedOut: return "TimedOut";
            case WriteStatus::Disconnected: return "Disconnected";
            default: return "Unknown";
        }
    }

/**
 * @brief Writable endpoint of an already paired printer.
 *
 * Resolved by the pairing layer; the driver only writes to it.
 */
    class GattCharacteristic {
    public:
        virtual ~GattCharacteristic() = default;

        /**
         * @brief Writes one chunk and waits until the transport accepted or refused it.
         * @param chunk Payload, never larger than maxPayloadSize() when that is non-zero.
         * @param timeout Upper bound for the write.
         * @return Outcome of the write.
         */
        virtual WriteStatus writeValue(const types::Bytes &chunk, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Negotiated payload size for a single write, 0 when unknown.
         */
        virtual size_t maxPayloadSize() const = 0;

        virtual bool isOpen() const = 0;
    };

} // namespace thermal::link
