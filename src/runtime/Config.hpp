#pragma once
#include <cstdint>
#include <string>

#include "process/Process.hpp"

namespace onionsite {

struct Config {
    static constexpr uint16_t DEFAULT_PUBLIC_PORT = 8080;
    static constexpr uint16_t DEFAULT_ONION_PORT  = 3000;

    uint16_t    public_port   = DEFAULT_PUBLIC_PORT;  // PORT
    uint16_t    onion_port    = DEFAULT_ONION_PORT;   // ONION_PORT, loopback only
    std::string helper_bin    = "./arti";             // ARTI_BIN
    std::string helper_config = "/etc/arti/onionservice.toml";  // --config
    std::string nickname      = "demo";               // ONION_NICKNAME
    bool        show_help     = false;

    // Long-running helper: <bin> proxy -c <config>
    Command helper_command() const;

    // Short-lived address query: <bin> -c <config> hss --nickname <nick> onion-address
    Command query_command() const;
};

// Port from an environment value. nullptr or blank selects the fallback; any
// other value must be a plain decimal in 0..65535 or StartupError is thrown.
uint16_t parse_port(const char* name, const char* value, uint16_t fallback);

// Reads PORT, ONION_PORT, ARTI_BIN, ONION_NICKNAME from the environment and
// --config / --help from the command line. Throws StartupError.
Config load_config(int argc, const char* const* argv);

// KEY=VALUE file loader. Existing environment variables win. A missing file
// is not an error. Returns the number of variables set.
int load_dotenv(const std::string& path);

const char* usage();

} // namespace onionsite
