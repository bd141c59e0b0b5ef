//
// Created by redeg on 26/04/2025.
//

#include "thermal/link/PrinterLink.hpp"
#include "thermal/events/EventSystem.hpp"
#include "logger/Logger.hpp"

namespace thermal::link {

    PrinterLink::PrinterLink()
            : characteristic_(nullptr), payloadLimit_(0), connected_(false) {
    }

    PrinterLink::PrinterLink(std::shared_ptr<GattCharacteristic> characteristic, size_t payloadLimit)
            : characteristic_(std::move(characteristic)), payloadLimit_(payloadLimit),
              connected_(characteristic_ != nullptr) {
    }

    LinkState PrinterLink::state() const {
        return connected_ ? LinkState::Connected : LinkState::Disconnected;
    }

    bool PrinterLink::isConnected() const {
        return connected_;
    }

    size_t PrinterLink::payloadLimit() const {
        if (payloadLimit_ > 0) return payloadLimit_;

        std::lock_guard<std::mutex> lock(stateMutex_);
        return characteristic_ ? characteristic_->maxPayloadSize() : 0;
    }

    std::shared_ptr<GattCharacteristic> PrinterLink::characteristic() const {
        if (!connected_) return nullptr;

        std::lock_guard<std::mutex> lock(stateMutex_);
        return characteristic_;
    }

    void PrinterLink::markDisconnected(const std::string &reason) {
        if (!connected_.exchange(false)) return;

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            characteristic_.reset();
        }

        Logger::logWarning("[PrinterLink] Disconnected: " + reason);
        events::EventBus::getInstance().publish(
                events::Event(events::EventType::LINK_DISCONNECTED, "PrinterLink", reason));
    }

    std::string linkStateToString(LinkState state) {
        switch (state) {
            case LinkState::Connected:
                return "Connected";
            case LinkState::Disconnected:
                return "Disconnected";
            default:
                return "Unknown";
        }
    }

} // namespace thermal::link
