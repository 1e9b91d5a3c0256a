#include "engine/core/ErrorChannel.hpp"

#include <algorithm>
#include <iostream>

namespace engine::core
{
namespace
{
constexpr std::size_t kRecentLimit = 32;
}

ErrorChannel::ErrorChannel()
{
    m_suppressions.emplace_back(kNoisyFontMessage);
}

std::size_t ErrorChannel::Subscribe(Listener listener)
{
    const std::size_t token = m_nextToken++;
    m_subscribers.push_back(Subscriber{token, std::move(listener)});
    return token;
}

void ErrorChannel::Unsubscribe(std::size_t token)
{
    m_subscribers.erase(
        std::remove_if(m_subscribers.begin(), m_subscribers.end(), [token](const Subscriber& s) { return s.token == token; }),
        m_subscribers.end()
    );
}

void ErrorChannel::AddSuppression(std::string fragment)
{
    if (!fragment.empty())
    {
        m_suppressions.push_back(std::move(fragment));
    }
}

void ErrorChannel::ClearSuppressions()
{
    m_suppressions.clear();
}

void ErrorChannel::Report(std::string source, std::string message, ErrorSeverity severity)
{
    ErrorReport report;
    report.source = std::move(source);
    report.message = std::move(message);
    report.severity = severity;
    m_queue.push(std::move(report));
}

bool ErrorChannel::IsSuppressed(const std::string& message) const
{
    return std::any_of(m_suppressions.begin(), m_suppressions.end(), [&message](const std::string& fragment) {
        return message.find(fragment) != std::string::npos;
    });
}

std::size_t ErrorChannel::Dispatch()
{
    std::size_t delivered = 0;
    while (!m_queue.empty())
    {
        ErrorReport report = std::move(m_queue.front());
        m_queue.pop();

        report.suppressed = IsSuppressed(report.message);
        report.handled = true;
        if (report.suppressed)
        {
            ++m_suppressedCount;
        }
        else
        {
            std::cerr << (report.severity == ErrorSeverity::Warning ? "Warning: " : "Error: ") << "[" << report.source
                      << "] " << report.message << "\n";
            for (const Subscriber& subscriber : m_subscribers)
            {
                subscriber.listener(report);
            }
            ++m_deliveredCount;
            ++delivered;
        }

        m_recent.push_back(std::move(report));
        if (m_recent.size() > kRecentLimit)
        {
            m_recent.erase(m_recent.begin());
        }
    }
    return delivered;
}
} // namespace engine::core
