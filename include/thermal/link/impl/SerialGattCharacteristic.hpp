#pragma once

#include "../GattCharacteristic.hpp"
#include <boost/asio.hpp>
#include <string>
#include <memory>
#include <mutex>
#include <cstdint>

namespace thermal::link {

/**
 * @brief Characteristic backed by a BLE-UART bridge that shows up as a tty.
 *
 * Covers rfcomm-bound printers (/dev/rfcomm0) and HM-10 style adapters on a USB
 * serial port. Each write runs the port's io_context for at most the chunk timeout.
 */
    class SerialGattCharacteristic : public GattCharacteristic {
    public:
        /**
         * @throws types::LinkOpenException when the device cannot be opened.
         */
        SerialGattCharacteristic(const std::string &devicePath, uint32_t baudrate, size_t payloadSize);

        ~SerialGattCharacteristic() override;

        WriteStatus writeValue(const types::Bytes &chunk, std::chrono::milliseconds timeout) override;

        size_t maxPayloadSize() const override;

        bool isOpen() const override;

    private:
        std::string devicePath_;
        size_t payloadSize_;
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        mutable std::mutex portMutex_;

        void configurePort(uint32_t baudrate);

        void closePort();

        static bool isConnectionLoss(const boost::system::error_code &ec);
    };

} // namespace thermal::link
