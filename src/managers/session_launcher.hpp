#pragma once

#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>

// Starts external programs on a captured interactive surface.
//
// Callbacks may run on a background thread. All output is delivered before
// on_exit, and on_exit is called exactly once per successful launch.
class SessionLauncher {
public:
    using OutputCallback = std::function<void(const std::string&)>;
    using ExitCallback = std::function<void(int exit_code)>;

    virtual ~SessionLauncher() = default;

    // True if `program` can be resolved on the search path.
    virtual bool program_available(const std::string& program) const = 0;

    // Allocate a surface and spawn argv on it. Returns an error (and spawns
    // nothing, calls nothing) if the surface or the process cannot be created.
    virtual Result<void> launch(const std::vector<std::string>& argv,
                                OutputCallback on_output,
                                ExitCallback on_exit) = 0;

    // Forward keystrokes to the running program. False if none is running.
    virtual bool send_input(const std::string& bytes) = 0;
};
