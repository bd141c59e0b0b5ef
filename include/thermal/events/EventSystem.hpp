//
// Created by redeg on 31/08/2025.
//

#pragma once

#include <chrono>
#include <vector>
#include <memory>
#include <mutex>
#include <string>

namespace thermal::events {

    enum class EventType {
        LINK_DISCONNECTED,
        JOB_STARTED,
        JOB_COMPLETED,
        JOB_ABORTED
    };

    struct Event {
        EventType type;
        std::string source;
        std::string message;
        std::chrono::steady_clock::time_point timestamp;

        Event(EventType t, std::string src, std::string msg = "")
                : type(t), source(std::move(src)), message(std::move(msg)),
                  timestamp(std::chrono::steady_clock::now()) {}
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const Event &event) = 0;
    };

    class EventBus {
    private:
        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<IEventObserver>> observers_;

    public:
        static EventBus &getInstance() {
            static EventBus instance;
            return instance;
        }

        void subscribe(const std::shared_ptr<IEventObserver> &observer) {
            std::lock_guard<std::mutex> lock(observersMutex_);
            observers_.push_back(observer);
        }

        void publish(const Event &event) {
            // Observers are notified outside the lock so they may publish in turn
            std::vector<std::shared_ptr<IEventObserver>> active;
            {
                std::lock_guard<std::mutex> lock(observersMutex_);
                auto it = observers_.begin();
                while (it != observers_.end()) {
                    if (auto observer = it->lock()) {
                        active.push_back(std::move(observer));
                        ++it;
                    } else {
                        it = observers_.erase(it);
                    }
                }
            }

            for (const auto &observer: active) {
                observer->onEvent(event);
            }
        }
    };

    inline std::string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::LINK_DISCONNECTED: return "LINK_DISCONNECTED";
            case EventType::JOB_STARTED: return "JOB_STARTED";
            case EventType::JOB_COMPLETED: return "JOB_COMPLETED";
            case EventType::JOB_ABORTED: return "JOB_ABORTED";
            default: return "UNKNOWN";
        }
    }

} // namespace thermal::events
