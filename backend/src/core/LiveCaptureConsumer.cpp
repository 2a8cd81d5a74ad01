#include "core/LiveCaptureConsumer.hpp"
#include "core/RecordNormalizer.hpp"

#include <cerrno>
#include <iostream>

#include <poll.h>
#include <unistd.h>

using json = nlohmann::json;

namespace punchsync {

void to_json(json& j, const CapturedEvent& e) {
    j = json{{"sequence", e.sequence}, {"event", e.event}, {"name", e.name}};
}

QuitKeyWatcher::QuitKeyWatcher(int fd, CancellationToken& cancel)
    : fd_(fd), cancel_(cancel), reader_(&QuitKeyWatcher::watch, this) {}

QuitKeyWatcher::~QuitKeyWatcher() {
    stop_.store(true);
    if (reader_.joinable()) reader_.join();
}

void QuitKeyWatcher::watch() {
    constexpr int kPollMillis = 200;
    std::string line;
    while (!stop_.load() && !cancel_.cancel_requested()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollMillis);
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) {
            std::cerr << "QuitKeyWatcher: poll failed, errno " << errno << std::endl;
            return;
        }
        if (ready == 0) continue;

        char buf[256];
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] != '\n') {
                line += buf[i];
                continue;
            }
            const std::string entry = RecordNormalizer::trim(line);
            line.clear();
            if (entry == "q" || entry == "Q") {
                cancel_.request_cancel();
                return;
            }
        }
    }
}

std::string to_string(CaptureEnd end) {
    switch (end) {
        case CaptureEnd::Cancelled: return "cancelled";
        case CaptureEnd::StreamClosed: return "stream_closed";
        case CaptureEnd::IdleLimit: return "idle_limit";
        case CaptureEnd::StreamError: return "stream_error";
    }
    return "unknown";
}

LiveCaptureConsumer::LiveCaptureConsumer(const NameResolver& names, EventHandler on_event)
    : names_(names), on_event_(std::move(on_event)) {}

CaptureSummary LiveCaptureConsumer::run(LiveEventStream& stream, const CancellationToken& cancel) {
    CaptureSummary summary;
    int64_t idle = 0;

    while (true) {
        if (cancel.cancel_requested()) {
            summary.end = CaptureEnd::Cancelled;
            break;
        }

        CaptureItem item;
        try {
            item = stream.next();
        } catch (const std::exception& e) {
            std::cerr << "LiveCapture: stream failed: " << e.what() << std::endl;
            summary.end = CaptureEnd::StreamError;
            summary.error = e.what();
            break;
        }

        if (item.signal == CaptureSignal::Closed) {
            summary.end = CaptureEnd::StreamClosed;
            break;
        }
        if (item.signal == CaptureSignal::Timeout) {
            ++summary.timeouts;
            if (idle_limit_ > 0 && ++idle >= idle_limit_) {
                summary.end = CaptureEnd::IdleLimit;
                break;
            }
            continue;
        }

        idle = 0;
        auto outcome = RecordNormalizer::normalize_attendance(item.event);
        if (auto* ev = std::get_if<AttendanceEvent>(&outcome)) {
            CapturedEvent captured;
            captured.sequence = ++summary.events;
            captured.name = names_.resolve(ev->uid, ev->user_id);
            captured.event = std::move(*ev);
            if (on_event_) on_event_(captured);
        } else if (std::holds_alternative<SkippedRecord>(outcome)) {
            ++summary.skipped;
        } else {
            ++summary.errored;
            if (summary.errored <= RecordNormalizer::kVerboseErrorLimit) {
                std::cerr << "LiveCapture: event rejected: " << std::get<ErroredRecord>(outcome).detail << std::endl;
            }
        }
    }
    return summary;
}

} // namespace punchsync
