//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_REGISTRY
#define STAMPEDE_DEFERRED_EXECUTOR_REGISTRY

#include <cstddef>
#include <memory>
#include <string>
#include <sstream>
#include <functional>
#include <unordered_map>

#include "logging.hpp"
#include "handle.hpp"

namespace sde {

/**
 @brief weak membership set of live handles

 The registry observes handles, it never owns them. A handle leaves the set
 only through `unregister_handle()`, which the executor calls when a release
 task brings the handle's hold count to 0. Handles with outstanding holds are
 never removed, even on request.

 A registry is an explicitly owned object. It is not synchronized, and must
 only be touched by the thread driving its `sde::executor`.
 */
struct registry : public printable {
    /// observer called synchronously whenever a handle is finalized
    using finalized_callback = std::function<void(const handle&)>;

    registry() : next_id_(1), peak_count_(0) { SDE_HIGH_CONSTRUCTOR(); }
    registry(const registry&) = delete;
    registry(registry&&) = delete;

    virtual ~registry() { SDE_HIGH_DESTRUCTOR(); }

    registry& operator=(const registry&) = delete;
    registry& operator=(registry&&) = delete;

    static inline std::string info_name() { return "sde::registry"; }
    inline std::string name() const { return registry::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "count:" << members_.size() << ", peak_count:" << peak_count_;
        return ss.str();
    }

    /**
     @brief allocate a new handle and register it
     @param label an optional initial label
     @return the allocated handle
     */
    std::shared_ptr<handle> make(std::string label = {});

    /**
     @brief add a handle to the membership set

     Registering an already registered handle does nothing.

     @return true if the handle was inserted, else false
     */
    bool register_handle(const std::shared_ptr<handle>& h);

    /**
     @brief remove a handle from the membership set and finalize it

     Silently returns false if the handle is not a member. Refuses, returning
     false, if the handle still has outstanding holds. On success the handle
     is `handle::finalized` and the finalized callback is called before
     returning.

     @return true if the handle was removed, else false
     */
    bool unregister_handle(handle& h);

    /// @return true if the handle is a member, else false
    bool contains(const handle& h) const;

    /// @return the cardinality of the membership set
    inline size_t count() const { return members_.size(); }

    /// @return the largest cardinality the membership set has reached
    inline size_t peak_count() const { return peak_count_; }

    /**
     @brief drop members which were destroyed without ever being finalized

     Handles that were registered but never acquired die when their last
     owner lets go. Their membership is only reclaimed here.

     @return the count of members dropped
     */
    size_t prune();

    /// install the observer of finalized handles, replacing any previous one
    inline void on_handle_finalized(finalized_callback cb) {
        SDE_MED_METHOD_ENTER("on_handle_finalized");
        on_finalized_ = std::move(cb);
    }

private:
    size_t next_id_;
    size_t peak_count_;

    // keyed by address, an entry is only trusted while its weak_ptr locks to
    // the same address
    std::unordered_map<const handle*, std::weak_ptr<handle>> members_;
    finalized_callback on_finalized_;
};

}

#endif
