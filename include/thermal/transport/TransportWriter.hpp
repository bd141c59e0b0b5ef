//
// Created by redeg on 26/04/2025.
//

#pragma once

#include "thermal/link/PrinterLink.hpp"
#include "thermal/types/Bytes.hpp"
#include "thermal/types/Result.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <vector>

namespace thermal::transport {

/**
 * @brief Delivers encoded buffers to a printer link in strict order.
 *
 * CRITICAL: exactly one chunk is outstanding at a time. Chunk k+1 is not written
 * until chunk k completed, and buffer N+1 is not started until every chunk of
 * buffer N completed. The first failure ends the job; nothing is retried, since
 * the printer cannot take back a half printed line.
 *
 * A successful result only means every byte was handed to the characteristic.
 * The printer does not acknowledge, so paper-out or a jam is not visible here.
 */
    class TransportWriter {
    public:
        static constexpr size_t DEFAULT_CHUNK_LIMIT = 20; // ATT MTU 23 minus header
        static constexpr std::chrono::milliseconds DEFAULT_CHUNK_TIMEOUT{5000};

        explicit TransportWriter(size_t defaultChunkLimit = DEFAULT_CHUNK_LIMIT,
                                 std::chrono::milliseconds chunkTimeout = DEFAULT_CHUNK_TIMEOUT);

        /**
         * @brief Writes one buffer, split into chunks no larger than the link's limit.
         * @param link Target link.
         * @param buffer Bytes to write; an empty buffer succeeds without writing.
         * @return Success, or the failure with command index 0 and the failed chunk.
         */
        types::Result send(link::PrinterLink &link, const types::Bytes &buffer);

        /**
         * @brief Writes every buffer in order, stopping at the first failure.
         * @param link Target link, used exclusively for the whole call.
         * @param buffers Encoded commands in print order.
         * @return Success, or the failure naming the index of the command that failed.
         */
        types::Result sendSequence(link::PrinterLink &link, const std::vector<types::Bytes> &buffers);

        /**
         * @brief Chunk size that will be used on this link.
         */
        size_t chunkLimitFor(const link::PrinterLink &link) const;

        std::chrono::milliseconds chunkTimeout() const { return chunkTimeout_; }

        /**
         * @brief Flag polled before every chunk; once set, the running job stops and the link is dropped.
         *
         * The flag may be set from a signal handler. The writer only reads it.
         */
        void setAbortFlag(const std::atomic<bool> *flag);

    private:
        size_t defaultChunkLimit_;
        std::chrono::milliseconds chunkTimeout_;
        const std::atomic<bool> *abortFlag_;

        /**
         * @brief Chunked write of one buffer. Caller holds the link's job mutex.
         * @param bytesWritten Running total for the job, advanced per accepted chunk.
         */
        types::Result sendLocked(link::PrinterLink &link, const types::Bytes &buffer, size_t commandIndex,
                                 size_t &bytesWritten);
    };

} // namespace thermal::transport
