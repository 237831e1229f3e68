#include <iostream>
#include <chrono>
#include <sde.hpp>

int main() {
    // configure the library and stash RAII management object on stack
    sde::lifecycle::config c;
    c.hrn.drain_threshold = 250;
    c.hrn.time_budget = std::chrono::milliseconds(100);
    auto lifecycle = sde::lifecycle::initialize(c);

    sde::registry r;
    sde::executor e(r, lifecycle->get_config().exe);
    sde::harness h(r, e, lifecycle->get_config().hrn);

    // acquire and save 2000 contexts, the executor gets no turn before cycle 251
    auto s = h.run_cycle(2000, true);

    for(auto& report : s.drains) {
        std::cout << report << std::endl;
    }

    std::cout << s << std::endl;
    std::cout << "live handles: " << r.count()
              << ", backlog: " << e.size()
              << ", pending changes: " << e.pending_changes_counter()
              << std::endl;

    // one unbounded turn dissipates the stampede
    auto settled = e.drain(sde::chrono::forever(), sde::unlimited_operations);
    std::cout << settled << std::endl;
    return 0;
}
