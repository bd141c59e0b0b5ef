#include "thermal/transport/TransportWriter.hpp"
#include "thermal/events/EventSystem.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <mutex>

namespace thermal::transport {

    TransportWriter::TransportWriter(size_t defaultChunkLimit, std::chrono::milliseconds chunkTimeout)
            : defaultChunkLimit_(defaultChunkLimit > 0 ? defaultChunkLimit : DEFAULT_CHUNK_LIMIT),
              chunkTimeout_(chunkTimeout),
              abortFlag_(nullptr) {
    }

    void TransportWriter::setAbortFlag(const std::atomic<bool> *flag) {
        abortFlag_ = flag;
    }

    size_t TransportWriter::chunkLimitFor(const link::PrinterLink &link) const {
        size_t limit = link.payloadLimit();
        return limit > 0 ? limit : defaultChunkLimit_;
    }

    types::Result TransportWriter::send(link::PrinterLink &link, const types::Bytes &buffer) {
        if (!link.isConnected()) {
            Logger::logError("[TransportWriter] send() without an active link");
            return types::Result::notConnected(0);
        }

        std::lock_guard<std::mutex> lock(link.jobMutex());
        size_t bytesWritten = 0;
        types::Result result = sendLocked(link, buffer, 0, bytesWritten);
        if (result.isSuccess()) {
            result.bytesWritten = bytesWritten;
        }
        return result;
    }

    types::Result TransportWriter::sendSequence(link::PrinterLink &link, const std::vector<types::Bytes> &buffers) {
        auto &bus = events::EventBus::getInstance();

        if (!link.isConnected()) {
            Logger::logError("[TransportWriter] sendSequence() without an active link, " +
                             std::to_string(buffers.size()) + " commands not sent");
            return types::Result::notConnected(0);
        }

        // A second job on the same link waits here until the first one is done
        std::lock_guard<std::mutex> lock(link.jobMutex());

        Logger::logInfo("[TransportWriter] Job started: " + std::to_string(buffers.size()) +
                        " commands, chunk limit " + std::to_string(chunkLimitFor(link)));
        bus.publish(events::Event(events::EventType::JOB_STARTED, "TransportWriter",
                                  std::to_string(buffers.size()) + " commands"));

        size_t bytesWritten = 0;
        for (size_t index = 0; index < buffers.size(); ++index) {
            types::Result result = sendLocked(link, buffers[index], index, bytesWritten);

            if (!result.isSuccess()) {
                Logger::logError("[TransportWriter] Job aborted at command " + std::to_string(index) + "/" +
                                 std::to_string(buffers.size()) + " (" + types::resultCodeToString(result.code) +
                                 "): " + result.message + ", " + std::to_string(buffers.size() - index - 1) +
                                 " commands abandoned");
                bus.publish(events::Event(events::EventType::JOB_ABORTED, "TransportWriter",
                                          "command " + std::to_string(index) + ": " + result.message));
                return result;
            }
        }

        Logger::logInfo("[TransportWriter] Job completed: " + std::to_string(bytesWritten) + " bytes handed over");
        bus.publish(events::Event(events::EventType::JOB_COMPLETED, "TransportWriter",
                                  std::to_string(bytesWritten) + " bytes"));
        return types::Result::success(bytesWritten, "All commands written");
    }

    types::Result TransportWriter::sendLocked(link::PrinterLink &link, const types::Bytes &buffer,
                                              size_t commandIndex, size_t &bytesWritten) {
        auto characteristic = link.characteristic();
        if (!characteristic) {
            return types::Result::disconnected("Link lost before command " + std::to_string(commandIndex),
                                               commandIndex, 0, bytesWritten);
        }

        const size_t limit = chunkLimitFor(link);
        const size_t chunkCount = (buffer.size() + limit - 1) / limit;

        for (size_t chunkIndex = 0; chunkIndex < chunkCount; ++chunkIndex) {
            if (abortFlag_ && abortFlag_->load()) {
                link.markDisconnected("print aborted");
                return types::Result::disconnected("Aborted before command " + std::to_string(commandIndex) +
                                                   " chunk " + std::to_string(chunkIndex),
                                                   commandIndex, chunkIndex, bytesWritten);
            }

            // Disconnect may arrive from the pairing layer between two chunks
            if (!link.isConnected()) {
                return types::Result::disconnected("Link disconnected during command " +
                                                   std::to_string(commandIndex),
                                                   commandIndex, chunkIndex, bytesWritten);
            }

            if (!characteristic->isOpen()) {
                link.markDisconnected("characteristic closed");
                return types::Result::disconnected("Characteristic closed before command " +
                                                   std::to_string(commandIndex),
                                                   commandIndex, chunkIndex, bytesWritten);
            }

            const size_t offset = chunkIndex * limit;
            const size_t length = std::min(limit, buffer.size() - offset);
            types::Bytes chunk(buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                               buffer.begin() + static_cast<std::ptrdiff_t>(offset + length));

            if (Logger::isEnabled(Logger::Level::Debug)) {
                Logger::logDebug("[TransportWriter] Command " + std::to_string(commandIndex) + " chunk " +
                                 std::to_string(chunkIndex + 1) + "/" + std::to_string(chunkCount) + ": " +
                                 types::toHex(chunk));
            }

            link::WriteStatus status = characteristic->writeValue(chunk, chunkTimeout_);

            switch (status) {
                case link::WriteStatus::Ok:
                    bytesWritten += length;
                    break;
                case link::WriteStatus::Disconnected:
                    link.markDisconnected("write failed on command " + std::to_string(commandIndex));
                    return types::Result::disconnected("Device disconnected while writing command " +
                                                       std::to_string(commandIndex),
                                                       commandIndex, chunkIndex, bytesWritten);
                case link::WriteStatus::TimedOut:
                    return types::Result::chunkWriteFailed("Chunk " + std::to_string(chunkIndex) + " timed out after " +
                                                           std::to_string(chunkTimeout_.count()) + "ms",
                                                           commandIndex, chunkIndex, bytesWritten);
                case link::WriteStatus::Rejected:
                default:
                    return types::Result::chunkWriteFailed("Chunk " + std::to_string(chunkIndex) +
                                                           " rejected by transport",
                                                           commandIndex, chunkIndex, bytesWritten);
            }
        }

        return types::Result::success(bytesWritten);
    }

} // namespace thermal::transport
