#pragma once

#include <string>

namespace updatechecker {

// Fire-and-forget start of an external program.
class Launcher {
public:
    virtual ~Launcher() = default;

    virtual void launch(const std::string& command, const std::string& arguments) = 0;
};

// Runs "<command> <arguments> &" through /bin/sh so the program outlives us.
class ShellLauncher final : public Launcher {
public:
    void launch(const std::string& command, const std::string& arguments) override;

    [[nodiscard]] static std::string buildCommandLine(const std::string& command,
                                                      const std::string& arguments);
};

} // namespace updatechecker
