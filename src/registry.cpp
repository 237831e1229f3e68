//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "registry.hpp"

std::shared_ptr<sde::handle> sde::registry::make(std::string label) {
    SDE_MED_METHOD_ENTER("make", label);
    auto h = std::make_shared<sde::handle>(next_id_, std::move(label));
    ++next_id_;
    register_handle(h);
    return h;
}

bool sde::registry::register_handle(const std::shared_ptr<sde::handle>& h) {
    if(!h) [[unlikely]] {
        SDE_ERROR_METHOD_BODY("register_handle","cannot register null handle");
        return false;
    }

    SDE_MED_METHOD_ENTER("register_handle", *h);
    auto it = members_.find(h.get());

    if(it != members_.end()) {
        if(it->second.lock() == h) {
            return false;
        }

        // stale entry of a destroyed handle which lived at the same address
        it->second = h;
    } else {
        members_.emplace(h.get(), h);
    }

    if(h->state_ == sde::handle::finalized) {
        // a revived handle starts over
        h->state_ = h->hold_count_ ? sde::handle::held : sde::handle::created;
    }

    if(members_.size() > peak_count_) {
        peak_count_ = members_.size();
    }

    return true;
}

bool sde::registry::unregister_handle(sde::handle& h) {
    SDE_MED_METHOD_ENTER("unregister_handle", h);
    auto it = members_.find(&h);

    if(it == members_.end()) {
        return false;
    }

    if(it->second.lock().get() != &h) [[unlikely]] {
        members_.erase(it);
        return false;
    }

    if(h.hold_count_) {
        SDE_WARNING_METHOD_BODY("unregister_handle","refused, ",h," is still held");
        return false;
    }

    members_.erase(it);
    h.state_ = sde::handle::finalized;
    SDE_LOW_METHOD_BODY("unregister_handle",h," finalized, ",members_.size()," handles remain");

    if(on_finalized_) {
        on_finalized_(h);
    }

    return true;
}

bool sde::registry::contains(const sde::handle& h) const {
    auto it = members_.find(&h);
    return it != members_.end() && it->second.lock().get() == &h;
}

size_t sde::registry::prune() {
    SDE_MED_METHOD_ENTER("prune");
    size_t dropped = 0;
    auto it = members_.begin();

    while(it != members_.end()) {
        if(it->second.expired()) {
            it = members_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    SDE_MED_METHOD_BODY("prune","dropped ",dropped);
    return dropped;
}
