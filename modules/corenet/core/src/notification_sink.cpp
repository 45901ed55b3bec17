#include "notification_sink.h"
#include "logger.h"

void LogNotificationSink::notify(const std::string& message) {
    LOG_INFO("NOTIFY: " + message);
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_callback;
    }
    if (callback) {
        callback(message);
    }
}

void LogNotificationSink::setCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}
