// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file core.cpp
 * @brief Core implementation for ux8 v0.1.
 */

#include "core.hpp"
#include "hal.hpp"

namespace ux8 {
namespace core {

ScopedISRLock::ScopedISRLock(hal::IRQControllerOps* irq_ops) : irq_ops_(irq_ops) {
    if (irq_ops_) irq_ops_->disable_tick_irq();
}

ScopedISRLock::~ScopedISRLock() {
    if (irq_ops_) irq_ops_->enable_tick_irq();
}

} // namespace core
} // namespace ux8
