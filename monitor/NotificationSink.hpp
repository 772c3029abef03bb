#pragma once

#include <iostream>
#include <string>

namespace lanwatch::monitor
{
    // Where security alerts go. The dashboard plugs in its own sink.
    class NotificationSink
    {
    public:
        virtual ~NotificationSink() = default;
        virtual void Notify(const std::string &message) = 0;
    };

    class LogNotificationSink : public NotificationSink
    {
    public:
        void Notify(const std::string &message) override
        {
            std::cerr << "[Alert] " << message << "\n";
        }
    };
}
