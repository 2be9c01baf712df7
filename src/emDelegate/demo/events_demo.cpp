#include <emDelegate/demo/events_demo.hpp>

#include <emDelegate/demo/delegates_demo.hpp>
#include <emDelegate/demo/notifier.hpp>
#include <emDelegate/delegate/make_delegate.hpp>
#include <emDelegate/platform/platform.hpp>

namespace emDelegate::demo {

namespace {

void on_notify_received(const char* message) {
    platform::logf("Named handler received: %s", message);
}

} // namespace

void run_events_demo() {
    notifier publisher;

    // Named function and lambda on the custom slot
    const auto named_handler = make_delegate<&on_notify_received>();
    publisher.notify += named_handler;

    auto lambda_handler = [](const char* message) { platform::logf("Lambda received: %s", message); };
    publisher.notify += make_delegate(lambda_handler);

    auto standard_handler = [](const notifier& sender, const events::event_args& args) {
        (void)sender;
        (void)args;
        platform::log("StandardNotify event triggered.");
    };
    publisher.standard_notify += make_delegate(standard_handler);

    publisher.raise_notify("Hello from custom event!");
    publisher.raise_standard_notify();

    // Raising an empty slot is a no-op
    publisher.notify -= named_handler;
    publisher.notify -= make_delegate(lambda_handler);
    const bool delivered = publisher.raise_notify("Nobody is listening");
    platform::logf("Subscribers after unsubscribe: %u (delivered=%s)",
                   static_cast<u32>(publisher.notify.subscriber_count()), delivered ? "true" : "false");
}

void run_all() {
    run_delegates_demo();
    run_events_demo();
}

} // namespace emDelegate::demo
