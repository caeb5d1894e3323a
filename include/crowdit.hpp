#pragma once

// High-level crowdit facade
// Composes the sale ledger and its storage

#include "crowdit/common/error.hpp"
#include "crowdit/common/hash.hpp"
#include "crowdit/sale/sale.hpp"
#include "crowdit/storage/snapshot_store.hpp"
