#pragma once

#include <string>

enum class Severity {
    Info,
    Warning,
    Error,
};

// User-facing notification sink.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& message, Severity severity) = 0;
};
