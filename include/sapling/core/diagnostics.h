#pragma once
#include <sapling/core/config.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace sapling::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

// "[severity] module/stage (cid:N): message". The cid part is omitted when
// the correlation id is zero.
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured log events. Events below the minimum severity are
// dropped before observers see them. Once `event_limit` events are held the
// oldest one is discarded for each new event.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t event_limit = config::kDefaultDiagnosticEventLimit);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    // Stamped on every event emitted afterwards.
    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void set_event_limit(std::size_t limit);
    std::size_t event_limit() const;

    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;

    void clear();
    std::size_t size() const;

private:
    void trim();

    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t event_limit_;
};

} // namespace sapling::core
