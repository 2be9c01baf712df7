#pragma once

namespace emDelegate::demo {

/**
 * @brief Subscribe named, lambda and standard-shaped handlers to a notifier
 *        and raise its events
 */
void run_events_demo();

// Delegates demo followed by the events demo
void run_all();

} // namespace emDelegate::demo
