#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "DeviceSession.hpp"
#include "core/NameResolver.hpp"
#include "core/Records.hpp"

namespace punchsync {

// Set from any thread; polled by the consumer before each pull.
class CancellationToken {
public:
    void request_cancel() noexcept { cancelled_.store(true); }
    bool cancel_requested() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Cancels `cancel` when a line reading "q" arrives on `fd`.
 *
 * The reader polls so it never blocks for long; the destructor stops and
 * joins it. End of input stops the reader without cancelling.
 */
class QuitKeyWatcher {
public:
    QuitKeyWatcher(int fd, CancellationToken& cancel);
    ~QuitKeyWatcher();

    QuitKeyWatcher(const QuitKeyWatcher&) = delete;
    QuitKeyWatcher& operator=(const QuitKeyWatcher&) = delete;

private:
    void watch();

    int fd_;
    CancellationToken& cancel_;
    std::atomic<bool> stop_{false};
    std::thread reader_;
};

struct CapturedEvent {
    int64_t sequence = 0;
    AttendanceEvent event;
    std::string name;
};

void to_json(nlohmann::json& j, const CapturedEvent& e);

enum class CaptureEnd { Cancelled, StreamClosed, IdleLimit, StreamError };

std::string to_string(CaptureEnd end);

struct CaptureSummary {
    int64_t events = 0;
    int64_t timeouts = 0;
    int64_t skipped = 0;
    int64_t errored = 0;
    CaptureEnd end = CaptureEnd::StreamClosed;
    std::string error;
};

class LiveCaptureConsumer {
public:
    using EventHandler = std::function<void(const CapturedEvent&)>;

    LiveCaptureConsumer(const NameResolver& names, EventHandler on_event);

    // Stop after this many consecutive timeouts; 0 waits forever.
    void set_idle_timeout_limit(int64_t limit) { idle_limit_ = limit; }

    // Runs until cancelled, closed, idle limit or stream failure. Never throws
    // for stream failures; the handler's own exceptions propagate.
    CaptureSummary run(LiveEventStream& stream, const CancellationToken& cancel);

private:
    const NameResolver& names_;
    EventHandler on_event_;
    int64_t idle_limit_ = 0;
};

} // namespace punchsync
