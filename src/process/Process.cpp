#include "process/Process.hpp"

#include <sys/wait.h>

#include <csignal>
#include <cstring>
#include <sstream>

using namespace onionsite;

std::string Command::to_string() const {
    std::ostringstream o;
    o << program;
    for (const auto& a : args) o << ' ' << a;
    return o.str();
}

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus s;
    if (WIFSIGNALED(status)) {
        s.kind = Kind::Signaled;
        s.code = WTERMSIG(status);
    } else {
        s.kind = Kind::Exited;
        s.code = WIFEXITED(status) ? WEXITSTATUS(status) : status;
    }
    return s;
}

std::string ExitStatus::to_string() const {
    if (kind == Kind::Signaled) {
        const char* name = ::strsignal(code);
        return "killed by signal " + std::to_string(code) +
               (name ? std::string(" (") + name + ")" : std::string());
    }
    return "exit status " + std::to_string(code);
}
