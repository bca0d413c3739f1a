#pragma once

// Common
#include "common/config.hpp"
#include "common/error.hpp"

// Ledger
#include "ledger/address.hpp"
#include "ledger/block.hpp"
#include "ledger/canonical.hpp"
#include "ledger/chain.hpp"
#include "ledger/clock.hpp"
#include "ledger/gas.hpp"
#include "ledger/hasher.hpp"
#include "ledger/transaction.hpp"
#include "ledger/transaction_pool.hpp"

// Storage
#include "storage/document_store.hpp"
#include "storage/file_store.hpp"
#include "storage/memory_store.hpp"
#include "storage/sqlite_store.hpp"

// Service
#include "service/ledger_service.hpp"
#include "service/records.hpp"
