#pragma once

#include <string>
#include <core/notifier.hpp>

// Terminal output that may arrive while readline is showing the prompt.
namespace console {

// While active, print() hides the prompt line, prints, and redraws it.
void set_prompt_active(bool active);

void print(const std::string& text);

} // namespace console

// Notifier printing theme-styled lines and mirroring them to the debug log.
class ConsoleNotifier : public Notifier {
public:
    void notify(const std::string& message, Severity severity) override;
};
