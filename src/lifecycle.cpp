//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "lifecycle.hpp"

std::unique_ptr<sde::lifecycle> sde::lifecycle::initialize(sde::lifecycle::config c) {
    SDE_INFO_FUNCTION_ENTER("sde::lifecycle::initialize");
    return std::unique_ptr<sde::lifecycle>(new sde::lifecycle(c));
}
