#pragma once

// High-level Surety facade
// Composes the commitment, ledger, claim and storage modules

#include "surety/claim/claim.hpp"
#include "surety/commitment/contract_book.hpp"
#include "surety/commitment/evaluator.hpp"
#include "surety/common/error.hpp"
#include "surety/common/log.hpp"
#include "surety/common/money.hpp"
#include "surety/engine/engine.hpp"
#include "surety/ledger/allocation.hpp"
#include "surety/ledger/ledger.hpp"
#include "surety/storage/file_store.hpp"
#include "surety/storage/journal.hpp"
#include "surety/subject/registry.hpp"
