#pragma once
// include/ozzoo/util/NotificationLog.h
//
// The zoo's event log. Every message is stamped with the simulated day it
// happened on; some also raise a toast that fades out in real time.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace ozzoo::util {

enum class NotifySeverity : std::uint8_t
{
    Info = 0,
    Warning,
    Error,
};

[[nodiscard]] const char* NotifySeverityName(NotifySeverity s) noexcept;

// What a message refers to; the GUI uses it to select the animal or enclosure.
struct NotifyTarget
{
    enum class Kind : std::uint8_t
    {
        None = 0,
        Animal,
        Enclosure,
    };

    Kind          kind = Kind::None;
    std::uint32_t id = 0;   // animal serial or enclosure id

    [[nodiscard]] static NotifyTarget None() noexcept { return {}; }
    [[nodiscard]] static NotifyTarget Animal(std::uint32_t serial) noexcept { return { Kind::Animal, serial }; }
    [[nodiscard]] static NotifyTarget Enclosure(std::uint32_t enclosureId) noexcept { return { Kind::Enclosure, enclosureId }; }
};

struct NotificationEntry
{
    int            day = 0;
    NotifySeverity severity = NotifySeverity::Info;
    std::string    text;
    NotifyTarget   target;
};

struct ToastEntry
{
    NotificationEntry entry;
    float             ttlSeconds = 0.0f;
};

class NotificationLog
{
public:
    // A positive ttl also raises a toast. Oldest entries fall off when full.
    void push(std::string text, NotifySeverity severity, int day,
              float toastTtlSeconds = 0.0f, NotifyTarget target = NotifyTarget::None());

    // Ages toasts by real time and drops the expired ones.
    void tick(float dtSeconds) noexcept;

    void clearAll() noexcept;

    void setMaxLogEntries(std::size_t n);
    void setMaxToasts(std::size_t n);
    [[nodiscard]] std::size_t maxLogEntries() const noexcept { return m_maxLog; }
    [[nodiscard]] std::size_t maxToasts() const noexcept { return m_maxToasts; }

    [[nodiscard]] const std::deque<NotificationEntry>& log() const noexcept { return m_log; }
    [[nodiscard]] const std::deque<ToastEntry>& toasts() const noexcept { return m_toasts; }

    // Last `n` entries, oldest first.
    [[nodiscard]] std::vector<NotificationEntry> recent(std::size_t n) const;

    // Entries of a given severity logged on `day`.
    [[nodiscard]] std::size_t countOn(int day, NotifySeverity severity) const noexcept;

private:
    std::size_t m_maxLog = 500;
    std::size_t m_maxToasts = 5;

    std::deque<NotificationEntry> m_log;
    std::deque<ToastEntry>        m_toasts;
};

} // namespace ozzoo::util
