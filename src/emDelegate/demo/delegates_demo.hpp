#pragma once

namespace emDelegate::demo {

/**
 * @brief Walk through custom, multicast, generic, lambda, bound-method and
 *        anonymous delegates, writing one line per step to the log sink
 */
void run_delegates_demo();

} // namespace emDelegate::demo
