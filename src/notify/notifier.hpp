#pragma once

#include <string>
#include <core/types.hpp>

// Operator notification for conditions that need a human.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& subject, const std::string& message) = 0;
};

// Pipes "Subject: ...\n\n<message>" to a shell command (e.g. a sendmail
// or mail invocation). Failures are logged and never raised.
class CommandNotifier : public Notifier {
public:
    explicit CommandNotifier(const NotifyConfig& config);

    void notify(const std::string& subject, const std::string& message) override;

private:
    NotifyConfig config_;
};
