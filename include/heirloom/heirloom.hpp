#pragma once

// High-level Heirloom facade
// Composes the escrow ledger and its error codes

#include "heirloom/common/error.hpp"
#include "heirloom/escrow/escrow.hpp"
