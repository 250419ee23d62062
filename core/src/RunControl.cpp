#include "reelcut/RunControl.h"

namespace reelcut {

bool RunHandle::tryAcquire() {
    bool expected = false;
    return running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void RunHandle::release() {
    running_.store(false, std::memory_order_release);
}

bool RunHandle::busy() const {
    return running_.load(std::memory_order_acquire);
}

RunLease::RunLease(RunHandle& handle) : handle_(handle), acquired_(handle.tryAcquire()) {}

RunLease::~RunLease() {
    if (acquired_) {
        handle_.release();
    }
}

}  // namespace reelcut
