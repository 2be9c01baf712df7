#include <emDelegate/demo/delegates_demo.hpp>

#include <emDelegate/delegate/generic_delegates.hpp>
#include <emDelegate/delegate/make_delegate.hpp>
#include <emDelegate/delegate/multicast_delegate.hpp>
#include <emDelegate/platform/platform.hpp>

#include <exception>
#include <stdexcept>

namespace emDelegate::demo {

namespace {

// Custom delegate types
using math_operation = multicast_delegate<int(int, int)>;
using log_operation  = multicast_delegate<void(const char*)>;

int add(int x, int y) { return x + y; }
int multiply(int x, int y) { return x * y; }

void log_message(const char* message) { platform::logf("Log: %s", message); }
void warn_message(const char* message) { platform::logf("Warning: %s", message); }

void reject_message(const char* message) {
    (void)message;
    throw std::runtime_error("subscriber rejected the message");
}

void report_fault(member_index_t member, const char* what) {
    (void)member;
    platform::logf("Error invoking delegate: %s", what);
}

// Closure written out by hand instead of as a lambda
struct divide_operation {
    int operator()(int x, int y) const { return x / y; }
};

class accumulator {
public:
    int accumulate(int x, int y) {
        total_ += x + y;
        return total_;
    }

private:
    int total_{0};
};

void check(const result<void, error_code>& res) {
    if (res.is_error()) {
        platform::logf("Invocation failed: %s", to_string(res.error()));
    }
}

const char* yes_no(const result<bool, error_code>& res) {
    return res.value_or(false) ? "true" : "false";
}

} // namespace

void run_delegates_demo() {
    // 1. Custom delegate type bound to a free function
    const math_operation add_operation = math_operation::create<&add>();
    platform::logf("Custom delegate: %d", add_operation(2, 3).value_or(0));

    const math_operation explicit_add(make_delegate<&add>());
    platform::logf("Custom delegate with explicit construction: %d", explicit_add.invoke(2, 3).value_or(0));

    // 2. Multicast: every member runs, in the order added
    action<const char*> message_delegate = action<const char*>::create<&log_message>();
    message_delegate += make_delegate<&warn_message>();
    check(message_delegate("Multicast delegate example"));

    log_operation log_delegate = log_operation::create<&log_message>();
    log_delegate += make_delegate<&warn_message>();
    check(log_delegate("Log and Warn using log_operation delegate"));

    platform::log("");
    platform::log("Multicast approach using get_invocation_list for log_operation:");
    for (const auto& member : log_delegate.get_invocation_list()) {
        try {
            member("Invoked individually via get_invocation_list");
        } catch (const std::exception& ex) {
            platform::logf("Error invoking delegate: %s", ex.what());
        }
    }

    // Only the last member's value comes back
    const math_operation combined = math_operation::create<&add>() + math_operation::create<&multiply>();
    platform::logf("Multicast return value: %d", combined(2, 3).value_or(0));

    // 3. Generic delegates
    auto multiply_lambda = [](int x, int y) { return x * y; };
    const func<int, int, int> multiply_operation = func<int, int, int>::create(multiply_lambda);
    platform::logf("Func delegate: %d", multiply_operation(3, 4).value_or(0));

    auto sum_block = [](int x, int y) {
        const int sum = x + y;
        return sum;
    };
    const func<int, int, int> sum_operation = func<int, int, int>::create(sum_block);
    platform::logf("Func anonymous delegate: %d", sum_operation(3, 4).value_or(0));

    auto greet = [](const char* name) { platform::logf("Hello, %s!", name); };
    const action<const char*> greet_action = action<const char*>::create(greet);
    check(greet_action("World"));

    auto log_block = [](const char* message) {
        platform::logf("Action delegate log: %s", message);
    };
    const action<const char*> log_action = action<const char*>::create(log_block);
    check(log_action("This is a log message using Action delegate"));

    auto is_even = [](int number) { return number % 2 == 0; };
    const predicate<int> is_even_predicate = predicate<int>::create(is_even);
    platform::logf("Predicate delegate: %s", yes_no(is_even_predicate(10)));

    auto is_positive = [](int number) {
        return number > 0;
    };
    const predicate<int> is_positive_predicate = predicate<int>::create(is_positive);
    platform::logf("Predicate delegate for positive check: %s", yes_no(is_positive_predicate(5)));

    // 4. Lambda bound to a custom delegate type
    auto subtract = [](int x, int y) { return x - y; };
    const math_operation subtract_operation = math_operation::create(subtract);
    platform::logf("Lambda delegate: %d", subtract_operation(5, 2).value_or(0));

    // 5. Method group conversion
    const math_operation multiply_method_operation = make_delegate<&multiply>();
    platform::logf("Method group delegate: %d", multiply_method_operation(6, 7).value_or(0));

    accumulator totals;
    const math_operation bound_operation = math_operation::create<accumulator, &accumulator::accumulate>(totals);
    const int first_total = bound_operation(2, 3).value_or(0);
    platform::logf("Bound method delegate: %d then %d", first_total, bound_operation(4, 5).value_or(0));

    // 6. Anonymous closure object
    divide_operation divide;
    const math_operation anonymous_operation = math_operation::create(divide);
    platform::logf("Anonymous delegate: %d", anonymous_operation(10, 2).value_or(0));

    // Closures keep referring to the state they captured
    int calls = 0;
    auto count_call = [&calls](const char* message) {
        (void)message;
        ++calls;
    };
    const log_operation counter = log_operation::create(count_call);
    for (int i = 0; i < 3; ++i) {
        check(counter("tick"));
    }
    platform::logf("Captured counter after 3 calls: %d", calls);

    // Failures: a combined call stops at the first throwing member ...
    log_operation fragile = log_operation::create<&log_message>();
    fragile += make_delegate<&reject_message>();
    fragile += make_delegate<&warn_message>();
    try {
        check(fragile("Combined invocation example"));
    } catch (const std::exception& ex) {
        platform::logf("Combined invocation aborted: %s", ex.what());
    }

    // ... while isolated invocation reports it and carries on
    const invocation_report report = fragile.invoke_each(
        log_operation::fault_handler_t::create<&report_fault>(), "Isolated invocation example");
    platform::logf("Isolated invocation: invoked=%u faulted=%u",
                   static_cast<u32>(report.invoked), static_cast<u32>(report.faulted));
}

} // namespace emDelegate::demo
