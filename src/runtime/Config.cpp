#include "runtime/Config.hpp"
#include "runtime/Errors.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace onionsite;

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (!v || is_blank(v)) return fallback;
    return v;
}

} // namespace

Command Config::helper_command() const {
    return Command{helper_bin, {"proxy", "-c", helper_config}};
}

Command Config::query_command() const {
    return Command{helper_bin, {"-c", helper_config, "hss", "--nickname", nickname, "onion-address"}};
}

uint16_t onionsite::parse_port(const char* name, const char* value, uint16_t fallback) {
    if (!value) return fallback;
    const std::string s(value);
    if (is_blank(s)) return fallback;

    // One leading '+' is allowed. No '-', no surrounding whitespace, no
    // trailing garbage.
    const size_t start = s[0] == '+' ? 1 : 0;
    if (start == s.size()) {
        throw StartupError(std::string("Unable to parse ") + name +
                           " as a port number: '" + s + "'");
    }
    unsigned long port = 0;
    for (char c : s.substr(start)) {
        if (c < '0' || c > '9') {
            throw StartupError(std::string("Unable to parse ") + name +
                               " as a port number: '" + s + "'");
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > 65535) {
            throw StartupError(std::string("Unable to parse ") + name +
                               " as a port number: '" + s + "' is out of range");
        }
    }
    return static_cast<uint16_t>(port);
}

Config onionsite::load_config(int argc, const char* const* argv) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) throw StartupError("Missing value for " + arg);
            cfg.helper_config = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            cfg.helper_config = arg.substr(9);
        } else {
            throw StartupError("Unknown argument: " + arg);
        }
    }
    if (cfg.helper_config.empty()) throw StartupError("--config must not be empty");

    cfg.public_port = parse_port("PORT", std::getenv("PORT"), Config::DEFAULT_PUBLIC_PORT);
    cfg.onion_port  = parse_port("ONION_PORT", std::getenv("ONION_PORT"), Config::DEFAULT_ONION_PORT);
    cfg.helper_bin  = env_or("ARTI_BIN", cfg.helper_bin);
    cfg.nickname    = env_or("ONION_NICKNAME", cfg.nickname);
    return cfg;
}

// ---------------------------------------------------------------------------
// .env loader. Skips blank lines and # comments, strips an "export " prefix
// and one pair of matching surrounding quotes from the value.
// ---------------------------------------------------------------------------
int onionsite::load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return 0;  // no .env = silent skip

    int loaded = 0;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        while (!key.empty() && key.back() == ' ') key.pop_back();
        while (!key.empty() && key.front() == ' ') key.erase(0, 1);
        if (key.empty()) continue;

        size_t vs = 0;
        while (vs < value.size() && value[vs] == ' ') vs++;
        value = value.substr(vs);

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!std::getenv(key.c_str())) {
            ::setenv(key.c_str(), value.c_str(), 0);
            ++loaded;
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << " (" << loaded << " set)\n";
    return loaded;
}

const char* onionsite::usage() {
    return
        "usage: onionsite [--config <path>]\n"
        "\n"
        "  --config, -c <path>  helper configuration file (default /etc/arti/onionservice.toml)\n"
        "  --help, -h           show this message\n"
        "\n"
        "environment:\n"
        "  PORT            public listener port (default 8080)\n"
        "  ONION_PORT      loopback listener port for the onion service (default 3000)\n"
        "  ARTI_BIN        helper executable (default ./arti)\n"
        "  ONION_NICKNAME  onion service nickname to query (default demo)\n";
}
