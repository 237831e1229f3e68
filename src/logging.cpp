//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <string>
#include <sstream>
#include <vector>

#include "loguru.hpp"
#include "logging.hpp"

/// library compile time macro determining default printing log level
#ifndef SDELOGLEVEL
// default to loguru::Verbosity_WARNING
#define SDELOGLEVEL -1
#endif

// force a loglevel of loguru::Verbosity_OFF or higher
#if SDELOGLEVEL < -9
#undef SDELOGLEVEL
#define SDELOGLEVEL -9
#endif

// force a loglevel of 9 or lower
#if SDELOGLEVEL > 9
#undef SDELOGLEVEL
#define SDELOGLEVEL 9
#endif

/// declaration of user replacable log initialization function
extern void sde_log_initialize();

#ifndef SDECUSTOMLOGINIT
/// the default log initialization code is defined here
void sde_log_initialize() {
    std::stringstream ss;
    ss << "-v" << SDELOGLEVEL;
    std::string process("stampede");
    std::string verbosity = ss.str();
    std::vector<char*> argv;
    argv.push_back(process.data());
    argv.push_back(verbosity.data());
    argv.push_back(nullptr);
    int argc = 2;
    loguru::Options opt;
    opt.main_thread_name = nullptr;
    opt.signal_options = loguru::SignalOptions::none();
    loguru::init(argc, argv.data(), opt);
}
#endif

namespace sde {
namespace detail {

struct log_initializer {
    // responsible for initializing the loguru framework
    log_initializer() { sde_log_initialize(); }
    int loglevel() const { return loguru::current_verbosity_cutoff(); }
} g_log_initializer; // globals are initialized before entering main()

}
}

int sde::config::logging::default_log_level() {
    return sde::detail::g_log_initializer.loglevel();
}

int& sde::logger::tl_loglevel() {
    thread_local int level = sde::config::logging::default_log_level();
    return level;
}

int sde::logger::thread_log_level() { return sde::logger::tl_loglevel(); }

void sde::logger::thread_log_level(int level) {
    if(level > 9) { level = 9; }
    else if(level < -9) { level = -9; }
    sde::logger::tl_loglevel() = level;
}
