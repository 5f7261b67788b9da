#include "kernel/command_router.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

namespace vigil::kernel {

void CommandRouter::register_handler(const std::string& name, std::string usage, CommandHandler handler) {
    if (handlers_.count(name)) {
        spdlog::warn("Command {} registered twice; keeping the latest", name);
    }
    handlers_[name] = Entry{std::move(usage), std::move(handler)};
}

bool CommandRouter::has(const std::string& name) const {
    return handlers_.count(name) > 0;
}

int CommandRouter::handle(const std::string& name, const std::vector<std::string>& args) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n" << usage();
        return 1;
    }
    return it->second.handler(args);
}

std::string CommandRouter::usage() const {
    std::string out = "Commands:\n";
    for (const auto& [name, entry] : handlers_) {
        out += "  " + entry.usage + "\n";
    }
    return out;
}

} // namespace vigil::kernel
