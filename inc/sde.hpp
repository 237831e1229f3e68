//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR
#define STAMPEDE_DEFERRED_EXECUTOR

#include "utility.hpp"
#include "chrono.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "queue.hpp"
#include "handle.hpp"
#include "registry.hpp"
#include "task.hpp"
#include "executor.hpp"
#include "loop.hpp"
#include "harness.hpp"
#include "lifecycle.hpp"

#endif
