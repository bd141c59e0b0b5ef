#include "thermal/link/impl/SerialGattCharacteristic.hpp"
#include "thermal/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>

namespace thermal::link {
    SerialGattCharacteristic::SerialGattCharacteristic(const std::string &devicePath, uint32_t baudrate,
                                                       size_t payloadSize)
            : devicePath_(devicePath), payloadSize_(payloadSize), io_context_(), serial_port_(nullptr) {
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, devicePath);
        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialGatt] Failed to open " + devicePath + ": " + e.what());
            throw types::LinkOpenException(devicePath, e.what());
        }

        if (!serial_port_->is_open()) {
            throw types::LinkOpenException(devicePath, "port not open after construction");
        }

        configurePort(baudrate);

        Logger::logInfo("[SerialGatt] Opened " + devicePath + " @ " + std::to_string(baudrate) +
                        " baud, payload " + std::to_string(payloadSize_) + " bytes");
    }

    SerialGattCharacteristic::~SerialGattCharacteristic() {
        std::lock_guard<std::mutex> lock(portMutex_);
        closePort();
    }

    void SerialGattCharacteristic::configurePort(uint32_t baudrate) {
        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            Logger::logWarning("[SerialGatt] Failed to set baud rate: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialGatt] Character size setting failed (non-critical): " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialGatt] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialGatt] Failed to set stop bits: " + ec.message());
        }

        // BLE bridges do their own flow control
        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
                boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialGatt] Failed to set flow control: " + ec.message());
        }
    }

    void SerialGattCharacteristic::closePort() {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            if (ec) {
                Logger::logError("[SerialGatt] Error closing port: " + ec.message());
            }
        }
    }

    WriteStatus SerialGattCharacteristic::writeValue(const types::Bytes &chunk, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(portMutex_);

        if (!serial_port_ || !serial_port_->is_open()) {
            Logger::logError("[SerialGatt] Write on closed port " + devicePath_);
            return WriteStatus::Disconnected;
        }

        boost::system::error_code writeEc;
        size_t bytesWritten = 0;
        bool completed = false;

        io_context_.restart();
        boost::asio::async_write(*serial_port_, boost::asio::buffer(chunk),
                                 [&](const boost::system::error_code &ec, size_t n) {
                                     writeEc = ec;
                                     bytesWritten = n;
                                     completed = true;
                                 });

        io_context_.run_for(timeout);

        if (!completed) {
            boost::system::error_code cancelEc;
            serial_port_->cancel(cancelEc);
            // Let the aborted handler run before the locals go out of scope
            io_context_.restart();
            io_context_.run();
            if (writeEc == boost::asio::error::operation_aborted || bytesWritten != chunk.size()) {
                Logger::logWarning("[SerialGatt] Write timed out after " + std::to_string(timeout.count()) + "ms");
                return WriteStatus::TimedOut;
            }
        }

        if (writeEc) {
            Logger::logError("[SerialGatt] Write error: " + writeEc.message());
            if (isConnectionLoss(writeEc)) {
                closePort();
                return WriteStatus::Disconnected;
            }
            return WriteStatus::Rejected;
        }

        if (bytesWritten != chunk.size()) {
            Logger::logWarning("[SerialGatt] Not all bytes written: " +
                               std::to_string(bytesWritten) + "/" + std::to_string(chunk.size()));
            return WriteStatus::Rejected;
        }

        return WriteStatus::Ok;
    }

    size_t SerialGattCharacteristic::maxPayloadSize() const {
        return payloadSize_;
    }

    bool SerialGattCharacteristic::isOpen() const {
        std::lock_guard<std::mutex> lock(portMutex_);
        return serial_port_ && serial_port_->is_open();
    }

    bool SerialGattCharacteristic::isConnectionLoss(const boost::system::error_code &ec) {
        return ec == boost::asio::error::broken_pipe ||
               ec == boost::asio::error::connection_reset ||
               ec == boost::asio::error::bad_descriptor ||
               ec == boost::asio::error::eof ||
               ec == boost::asio::error::not_connected ||
               // tty hang-up: the bridge or pty peer went away
               ec == boost::system::errc::io_error ||
               ec == boost::system::errc::no_such_device ||
               ec == boost::system::errc::no_such_device_or_address;
    }
} // namespace thermal::link
