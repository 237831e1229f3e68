//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_LIFECYCLE
#define STAMPEDE_DEFERRED_EXECUTOR_LIFECYCLE

#include <memory>
#include <string>
#include <sstream>

#include "logging.hpp"
#include "executor.hpp"
#include "harness.hpp"

namespace sde {

/**
 @brief RAII configuration object for this library

 A lifecycle holds the configuration the caller chose for the library and
 applies its logging section to the thread which created it. When the
 lifecycle goes out of scope that thread's previous log level is restored.

 Unlike a framework service there is no process-wide instance. Registries,
 executors and harnesses are explicitly owned objects, the lifecycle only
 hands out their configuration:
 ```
 auto lf = sde::initialize();
 sde::registry r;
 sde::executor e(r, lf->get_config().exe);
 sde::harness h(r, e, lf->get_config().hrn);
 ```
 */
struct lifecycle : public sde::printable {
    /**
     @brief configuration for the library

     The user can customize these options at runtime and pass the result to
     `sde::lifecycle::initialize()`.

     Default values are determined by compiler defines.
     */
    struct config {
        struct logging {
            logging();

            /**
             @brief runtime log level of the initializing thread

             Defaults set by compiler define(s):
             SDELOGLEVEL
             */
            int loglevel;
        };

        logging log;

        /// default drain budget of executors
        sde::executor::config exe;

        /// drain cadence and budget of harnesses
        sde::harness::config hrn;
    };

    virtual ~lifecycle() {
        SDE_INFO_DESTRUCTOR();
        sde::logger::thread_log_level(previous_loglevel_);
    }

    /**
     @brief construct the library configuration and apply it

     The logging configuration is applied to the calling thread immediately.

     @param c optional library configuration
     @return a lifecycle object holding the configuration
     */
    static std::unique_ptr<sde::lifecycle> initialize(config c = {});

    static inline std::string info_name() { return "sde::lifecycle"; }
    inline std::string name() const { return lifecycle::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "loglevel:" << config_.log.loglevel
           << ", drain_threshold:" << config_.hrn.drain_threshold;
        return ss.str();
    }

    /// return the lifecycle's config
    inline const config& get_config() const { return config_; }

private:
    lifecycle(const config& c) :
        config_(c),
        previous_loglevel_(sde::logger::thread_log_level())
    {
        sde::logger::thread_log_level(config_.log.loglevel);
        SDE_INFO_CONSTRUCTOR();
    }

    config config_;
    int previous_loglevel_;
};

/**
 @brief a convenience for calling `sde::lifecycle::initialize()`
 @returns the newly allocated and constructed `sde::lifecycle` pointer
 */
inline std::unique_ptr<lifecycle> initialize() {
    return sde::lifecycle::initialize();
}

}

#endif
