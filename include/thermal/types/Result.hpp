#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace thermal::types {

    enum class ResultCode {
        Success,
        LinkNotConnected,
        ChunkWriteFailed,
        LinkDisconnected
    };

    /**
     * @brief Outcome of a transport operation.
     *
     * Success means the bytes were handed to the link's characteristic. The printer
     * sends no acknowledgment, so a successful result does not prove the receipt
     * was physically printed.
     */
    struct Result {
        ResultCode code;
        std::string message;
        std::optional<size_t> commandIndex;
        std::optional<size_t> chunkIndex;
        size_t bytesWritten = 0;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isNotConnected() const {
            return code == ResultCode::LinkNotConnected;
        }

        inline bool isChunkWriteFailed() const {
            return code == ResultCode::ChunkWriteFailed;
        }

        inline bool isDisconnected() const {
            return code == ResultCode::LinkDisconnected;
        }

        static inline Result success(size_t bytesWritten, const std::string &msg = "Success") {
            return {ResultCode::Success, msg, std::nullopt, std::nullopt, bytesWritten};
        }

        static inline Result notConnected(size_t commandIndex) {
            return {ResultCode::LinkNotConnected, "Printer link not connected", commandIndex, std::nullopt, 0};
        }

        static inline Result chunkWriteFailed(const std::string &msg, size_t commandIndex, size_t chunkIndex,
                                              size_t bytesWritten) {
            return {ResultCode::ChunkWriteFailed, msg, commandIndex, chunkIndex, bytesWritten};
        }

        static inline Result disconnected(const std::string &msg, size_t commandIndex, size_t chunkIndex,
                                          size_t bytesWritten) {
            return {ResultCode::LinkDisconnected, msg, commandIndex, chunkIndex, bytesWritten};
        }
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success:
                return "Success";
            case ResultCode::LinkNotConnected:
                return "LinkNotConnected";
            case ResultCode::ChunkWriteFailed:
                return "ChunkWriteFailed";
            case ResultCode::LinkDisconnected:
                return "LinkDisconnected";
            default:
                return "Unknown";
        }
    }

}
