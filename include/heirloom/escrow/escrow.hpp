#pragma once

#include "auth_index.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_log.hpp"
#include "ledger.hpp"
#include "plan.hpp"
#include "transfer.hpp"

namespace heirloom::escrow {
    // Aggregates escrow headers under heirloom::escrow
}
