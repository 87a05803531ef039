/**
 * @file recording_sink.hpp
 * @brief EventSink that stores every event and lets tests wait for them.
 */

#pragma once
#include "core/events.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

class RecordingSink : public tabvisor::core::EventSink {
public:
    using Event = tabvisor::core::Event;
    using EventKind = tabvisor::core::EventKind;

    void emit(const Event& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        cv_.notify_all();
    }

    std::vector<Event> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<Event> of(EventKind kind, const std::string& session_id) {
        std::vector<Event> out;
        for (const auto& e : events()) {
            if (e.kind == kind && e.session_id == session_id) out.push_back(e);
        }
        return out;
    }

    /** @brief Concatenated text of all events of a kind for a session. */
    std::string text_of(EventKind kind, const std::string& session_id) {
        std::string out;
        for (const auto& e : of(kind, session_id)) out += e.text;
        return out;
    }

    /** @brief Waits until pred(events) holds. */
    bool wait_until(const std::function<bool(const std::vector<Event>&)>& pred, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return pred(events_); });
    }

    bool wait_for(EventKind kind, const std::string& session_id, int timeout_ms = 5000) {
        return wait_until([&](const std::vector<Event>& evs) {
            for (const auto& e : evs) {
                if (e.kind == kind && e.session_id == session_id) return true;
            }
            return false;
        }, timeout_ms);
    }

    /** @brief Waits for an event of a kind whose text contains needle. */
    bool wait_for_text(EventKind kind, const std::string& session_id, const std::string& needle,
                       int timeout_ms = 5000) {
        return wait_until([&](const std::vector<Event>& evs) {
            std::string all;
            for (const auto& e : evs) {
                if (e.kind == kind && e.session_id == session_id) all += e.text;
            }
            return all.find(needle) != std::string::npos;
        }, timeout_ms);
    }

    bool wait_for_pid(EventKind kind, const std::string& session_id, pid_t pid, int timeout_ms = 5000) {
        return wait_until([&](const std::vector<Event>& evs) {
            for (const auto& e : evs) {
                if (e.kind == kind && e.session_id == session_id && e.pid == pid) return true;
            }
            return false;
        }, timeout_ms);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Event> events_;
};
