#include "ozzoo/util/NotificationLog.h"

#include <algorithm>
#include <utility>

namespace ozzoo::util {

const char* NotifySeverityName(NotifySeverity s) noexcept
{
    switch (s)
    {
    case NotifySeverity::Info:    return "INFO";
    case NotifySeverity::Warning: return "WARN";
    case NotifySeverity::Error:   return "ERROR";
    }
    return "?";
}

void NotificationLog::push(std::string text, NotifySeverity severity, int day,
                           float toastTtlSeconds, NotifyTarget target)
{
    m_log.push_back(NotificationEntry{ day, severity, std::move(text), target });
    while (m_log.size() > m_maxLog)
        m_log.pop_front();

    if (toastTtlSeconds > 0.0f)
    {
        m_toasts.push_back(ToastEntry{ m_log.back(), toastTtlSeconds });
        while (m_toasts.size() > m_maxToasts)
            m_toasts.pop_front();
    }
}

void NotificationLog::tick(float dtSeconds) noexcept
{
    if (!(dtSeconds > 0.0f))
        return;

    for (ToastEntry& t : m_toasts)
        t.ttlSeconds -= dtSeconds;
    std::erase_if(m_toasts, [](const ToastEntry& t) { return t.ttlSeconds <= 0.0f; });
}

void NotificationLog::clearAll() noexcept
{
    m_log.clear();
    m_toasts.clear();
}

void NotificationLog::setMaxLogEntries(std::size_t n)
{
    m_maxLog = std::max<std::size_t>(1, n);
    while (m_log.size() > m_maxLog)
        m_log.pop_front();
}

void NotificationLog::setMaxToasts(std::size_t n)
{
    m_maxToasts = std::max<std::size_t>(1, n);
    while (m_toasts.size() > m_maxToasts)
        m_toasts.pop_front();
}

std::vector<NotificationEntry> NotificationLog::recent(std::size_t n) const
{
    const std::size_t skip = m_log.size() > n ? m_log.size() - n : 0;
    return { m_log.begin() + static_cast<std::ptrdiff_t>(skip), m_log.end() };
}

std::size_t NotificationLog::countOn(int day, NotifySeverity severity) const noexcept
{
    return static_cast<std::size_t>(std::count_if(m_log.begin(), m_log.end(), [&](const NotificationEntry& e) {
        return e.day == day && e.severity == severity;
    }));
}

} // namespace ozzoo::util
