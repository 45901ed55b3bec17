#ifndef NOTIFICATION_SINK_H
#define NOTIFICATION_SINK_H

#include <functional>
#include <mutex>
#include <string>

/**
 * Receives human-readable descriptions of discrete events
 * (connected, disconnected, file progress, errors).
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const std::string& message) = 0;
};

// Writes notifications to the log and forwards them to an optional UI callback.
class LogNotificationSink : public NotificationSink {
public:
    void notify(const std::string& message) override;
    void setCallback(std::function<void(const std::string&)> callback);

private:
    std::mutex m_mutex;
    std::function<void(const std::string&)> m_callback;
};

#endif // NOTIFICATION_SINK_H
