#pragma once

#include <cstddef>
#include <functional>
#include <queue>
#include <string>
#include <vector>

namespace engine::core
{
enum class ErrorSeverity
{
    Warning,
    Error
};

struct ErrorReport
{
    std::string source;
    std::string message;
    ErrorSeverity severity = ErrorSeverity::Error;
    bool suppressed = false;
    bool handled = false;
};

/// Collects failures raised inside an embedded application and hands them to
/// the host. Nothing reported here propagates further.
class ErrorChannel
{
public:
    using Listener = std::function<void(const ErrorReport&)>;

    ErrorChannel();

    std::size_t Subscribe(Listener listener);
    void Unsubscribe(std::size_t token);

    /// Messages containing |fragment| are marked handled without reaching listeners.
    void AddSuppression(std::string fragment);
    void ClearSuppressions();

    void Report(std::string source, std::string message, ErrorSeverity severity = ErrorSeverity::Error);
    std::size_t Dispatch();

    [[nodiscard]] bool IsSuppressed(const std::string& message) const;
    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] std::size_t SuppressedCount() const { return m_suppressedCount; }
    [[nodiscard]] std::size_t DeliveredCount() const { return m_deliveredCount; }
    [[nodiscard]] const std::vector<ErrorReport>& Recent() const { return m_recent; }

    static constexpr const char* kNoisyFontMessage = "BlueHighway.ttf";

private:
    struct Subscriber
    {
        std::size_t token = 0;
        Listener listener;
    };

    std::vector<Subscriber> m_subscribers;
    std::vector<std::string> m_suppressions;
    std::queue<ErrorReport> m_queue;
    std::vector<ErrorReport> m_recent;
    std::size_t m_nextToken = 1;
    std::size_t m_suppressedCount = 0;
    std::size_t m_deliveredCount = 0;
};
} // namespace engine::core
