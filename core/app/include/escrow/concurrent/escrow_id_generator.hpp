#pragma once

#include "escrow/domain/escrow.hpp"

#include <atomic>
#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowIdGenerator — thread-safe, monotonically increasing escrow ids
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique escrow ids from an atomic counter starting at 1
//         (0 means "unset").
//
// @details
// Owned by the EscrowRegistry as a value member. initialize_escrow() may be
// called from any number of threads at once; fetch_add guarantees each one
// gets a distinct id. Relaxed ordering is enough: the id is published to
// other threads through the registry's map mutex, not through the counter.
//
// After hydrating persisted escrows the registry calls advancePast() so new
// ids never collide with restored ones.
// -----------------------------------------------------------------------------
class EscrowIdGenerator {
 public:
  EscrowIdGenerator() = default;

  EscrowIdGenerator(const EscrowIdGenerator&) = delete;
  EscrowIdGenerator& operator=(const EscrowIdGenerator&) = delete;
  EscrowIdGenerator(EscrowIdGenerator&&) = delete;
  EscrowIdGenerator& operator=(EscrowIdGenerator&&) = delete;

  domain::EscrowId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Ensures every future id is greater than `id`.
  void advancePast(domain::EscrowId id) {
    domain::EscrowId current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<domain::EscrowId> next_id_{1};
};

}  // namespace escrow
