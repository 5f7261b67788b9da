#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vigil::kernel {

// Handler: (arguments after the command name) -> process exit code
using CommandHandler = std::function<int(const std::vector<std::string>& args)>;

class CommandRouter {
public:
    void register_handler(const std::string& name, std::string usage, CommandHandler handler);

    bool has(const std::string& name) const;

    // Dispatch; unknown commands print usage and return 1
    int handle(const std::string& name, const std::vector<std::string>& args) const;

    // One line per command
    std::string usage() const;

private:
    struct Entry {
        std::string usage;
        CommandHandler handler;
    };
    std::map<std::string, Entry> handlers_;
};

// A group of related commands
class CommandModule {
public:
    virtual ~CommandModule() = default;
    virtual void register_commands(CommandRouter& router) = 0;
};

} // namespace vigil::kernel
