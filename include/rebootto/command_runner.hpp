#pragma once
#include <string>
#include <vector>

namespace rebootto {

struct CommandResult {
    int exit_code = 0;   // -1 if the process did not exit normally
    std::string output;  // captured stdout, empty unless requested

    bool ok() const { return exit_code == 0; }
};

/**
 * ICommandRunner
 *
 * The only way the tool talks to the outside world. Looks the command up in
 * PATH and waits for it to finish.
 * @throws LaunchError if the command cannot be started
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult run(const std::string& name,
                              const std::vector<std::string>& args,
                              bool capture_output = false) = 0;
};

class ProcessRunner : public ICommandRunner {
public:
    CommandResult run(const std::string& name,
                      const std::vector<std::string>& args,
                      bool capture_output = false) override;
};

} // namespace rebootto
