#include <doctest/doctest.h>

#include <emDelegate/delegate/make_delegate.hpp>
#include <emDelegate/delegate/multicast_delegate.hpp>
#include <emDelegate/error/error_handler.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace emDelegate;

namespace {

using math_operation = multicast_delegate<int(int, int)>;
using trace_operation = multicast_delegate<void(int)>;

int add(int x, int y) { return x + y; }
int multiply(int x, int y) { return x * y; }
int subtract(int x, int y) { return x - y; }
int divide(int x, int y) { return x / y; }

std::vector<std::string>& trace() {
    static std::vector<std::string> calls;
    return calls;
}

void trace_a(int value) { trace().push_back("A" + std::to_string(value)); }
void trace_b(int value) { trace().push_back("B" + std::to_string(value)); }
void trace_c(int value) { trace().push_back("C" + std::to_string(value)); }

void throw_b(int value) {
    trace().push_back("B" + std::to_string(value));
    throw std::runtime_error("B failed");
}

void throw_int(int value) {
    trace().push_back("B" + std::to_string(value));
    throw 42;
}

struct fault_log {
    std::vector<member_index_t> members;
    std::vector<std::string> messages;

    void operator()(member_index_t member, const char* what) {
        members.push_back(member);
        messages.emplace_back(what);
    }
};

struct scaler {
    int factor;
    int scale(int x, int y) { return (x + y) * factor; }
    int peek(int x, int y) const { return x * y * factor; }
};

struct trace_fixture {
    trace_fixture() {
        trace().clear();
        error::get_global_error_handler().reset();
    }
};

} // namespace

TEST_CASE("multicast_delegate: single free functions")
{
    CHECK(math_operation::create<&multiply>()(6, 7).value() == 42);
    CHECK(math_operation::create<&subtract>()(5, 2).value() == 3);
    CHECK(math_operation::create<&divide>()(10, 2).value() == 5);
    CHECK(math_operation(make_delegate<&add>()).invoke(2, 3).value() == 5);
}

TEST_CASE("multicast_delegate: combined call returns the last member's value")
{
    math_operation list = math_operation::create<&add>();
    list += make_delegate<&multiply>();

    REQUIRE(list.size() == 2);
    const auto res = list(2, 3);
    REQUIRE(res.is_ok());
    CHECK(res.value() == 6);

    // Reversed order gives the other member's value
    const math_operation reversed = math_operation::create<&multiply>() + math_operation::create<&add>();
    CHECK(reversed(2, 3).value() == 5);
}

TEST_CASE("multicast_delegate: intermediate members still run")
{
    int calls = 0;
    auto counted_add = [&calls](int x, int y) {
        ++calls;
        return x + y;
    };
    math_operation list = math_operation::create(counted_add);
    list += make_delegate<&multiply>();

    CHECK(list(4, 5).value() == 20);
    CHECK(calls == 1);
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: members run in registration order")
{
    trace_operation list;
    list += make_delegate<&trace_c>();
    list += make_delegate<&trace_a>();
    list += make_delegate<&trace_b>();

    REQUIRE(list.invoke(1).is_ok());
    CHECK(trace() == std::vector<std::string>{"C1", "A1", "B1"});
}

TEST_CASE("multicast_delegate: empty list reports empty_invocation_list")
{
    const math_operation list;
    CHECK(list.empty());
    CHECK_FALSE(static_cast<bool>(list));

    const auto res = list(1, 2);
    REQUIRE(res.is_error());
    CHECK(res.error() == error_code::empty_invocation_list);
    CHECK(res.value_or(-1) == -1);

    const trace_operation actions;
    const auto void_res = actions.invoke(1);
    REQUIRE(void_res.is_error());
    CHECK(void_res.error() == error_code::empty_invocation_list);
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: invoke_if is a guarded no-op when empty")
{
    trace_operation list;
    CHECK_FALSE(list.invoke_if(7));
    CHECK(trace().empty());

    list += make_delegate<&trace_a>();
    CHECK(list.invoke_if(7));
    CHECK(trace() == std::vector<std::string>{"A7"});
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: throwing member aborts a combined call")
{
    trace_operation list;
    list += make_delegate<&trace_a>();
    list += make_delegate<&throw_b>();
    list += make_delegate<&trace_c>();

    CHECK_THROWS_WITH_AS(list.invoke(2), "B failed", std::runtime_error);
    CHECK(trace() == std::vector<std::string>{"A2", "B2"});
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: isolated invocation continues past a throwing member")
{
    trace_operation list;
    list += make_delegate<&trace_a>();
    list += make_delegate<&throw_b>();
    list += make_delegate<&trace_c>();

    fault_log faults;
    const invocation_report report = list.invoke_each(make_delegate(faults), 3);

    CHECK(trace() == std::vector<std::string>{"A3", "B3", "C3"});
    CHECK(report.invoked == 3);
    CHECK(report.faulted == 1);
    CHECK_FALSE(report.all_succeeded());
    REQUIRE(faults.members.size() == 1);
    CHECK(faults.members[0] == 1);
    CHECK(faults.messages[0] == "B failed");
    // A handler was given, so nothing reached the global handler
    CHECK(error::get_global_error_handler().get_error_count() == 0);
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: isolated invocation without a handler reports globally")
{
    trace_operation list;
    list += make_delegate<&throw_b>();
    list += make_delegate<&trace_c>();

    const invocation_report report = list.invoke_each(4);

    CHECK(report.invoked == 2);
    CHECK(report.faulted == 1);
    CHECK(trace() == std::vector<std::string>{"B4", "C4"});

    const auto& handler = error::get_global_error_handler();
    REQUIRE(handler.get_error_count() == 1);
    const auto& ctx = handler.get_last_error();
    CHECK(ctx.event == error::error_event::invocation_fault);
    CHECK(ctx.code == error_code::member_fault);
    CHECK(ctx.member == 0);
    CHECK(std::string(ctx.message.c_str()) == "B failed");
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: isolated invocation survives exceptions of any type")
{
    trace_operation list;
    list += make_delegate<&trace_a>();
    list += make_delegate<&throw_int>();
    list += make_delegate<&trace_c>();

    fault_log faults;
    const invocation_report report = list.invoke_each(make_delegate(faults), 3);

    CHECK(trace() == std::vector<std::string>{"A3", "B3", "C3"});
    CHECK(report.invoked == 3);
    CHECK(report.faulted == 1);
    REQUIRE(faults.members.size() == 1);
    CHECK(faults.members[0] == 1);
    CHECK(faults.messages[0] == "unknown exception");

    // Without a handler the fault lands in the global handler
    trace().clear();
    CHECK(list.invoke_each(3).faulted == 1);
    CHECK(trace() == std::vector<std::string>{"A3", "B3", "C3"});
    const auto& ctx = error::get_global_error_handler().get_last_error();
    CHECK(ctx.code == error_code::member_fault);
    CHECK(std::string(ctx.message.c_str()) == "unknown exception");
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: get_invocation_list is a snapshot")
{
    trace_operation list;
    list += make_delegate<&trace_a>();
    list += make_delegate<&trace_b>();

    auto members = list.get_invocation_list();
    list.clear();

    REQUIRE(members.size() == 2);
    for (const auto& member : members) {
        member(5);
    }
    CHECK(trace() == std::vector<std::string>{"A5", "B5"});
    CHECK(list.empty());
}

TEST_CASE("multicast_delegate: remove drops the last occurrence only")
{
    const auto a = make_delegate<&trace_a>();
    const auto b = make_delegate<&trace_b>();

    trace_operation list;
    list += a;
    list += b;
    list += a;

    REQUIRE(list.remove(a).is_ok());
    const auto members = list.get_invocation_list();
    REQUIRE(members.size() == 2);
    CHECK(members[0] == a);
    CHECK(members[1] == b);

    const auto miss = list.remove(make_delegate<&trace_c>());
    REQUIRE(miss.is_error());
    CHECK(miss.error() == error_code::not_found);
    CHECK(list.size() == 2);
}

TEST_CASE("multicast_delegate: removing a sub-list takes the last contiguous run")
{
    const auto a = make_delegate<&trace_a>();
    const auto b = make_delegate<&trace_b>();
    const auto c = make_delegate<&trace_c>();

    trace_operation list;
    list += a;
    list += b;
    list += c;
    list += a;
    list += b;

    trace_operation run = a;
    run += b;

    REQUIRE(list.remove(run).is_ok());
    trace_operation expected = a;
    expected += b;
    expected += c;
    CHECK(list == expected);

    trace_operation absent = c;
    absent += b;
    CHECK(list.remove(absent).error() == error_code::not_found);
    CHECK(list.remove(trace_operation()).is_ok());
    CHECK(list == expected);
}

TEST_CASE("multicast_delegate: bound member functions and functors")
{
    scaler by_two{2};
    const math_operation bound = math_operation::create<scaler, &scaler::scale>(by_two);
    CHECK(bound(1, 2).value() == 6);

    by_two.factor = 10;
    CHECK(bound(1, 2).value() == 30);

    const scaler by_three{3};
    const math_operation const_bound = math_operation::create<scaler, &scaler::peek>(by_three);
    CHECK(const_bound(2, 2).value() == 12);

    auto closure = make_delegate<&scaler::scale>(by_two);
    CHECK(closure(0, 1) == 10);
}

TEST_CASE("multicast_delegate: add rejects empty references and respects capacity")
{
    error::get_global_error_handler().reset();

    multicast_delegate<int(int, int), 2> small;
    CHECK(small.add(math_operation::delegate_type()).error() == error_code::invalid_parameter);
    CHECK(small.empty());

    REQUIRE(small.add(make_delegate<&add>()).is_ok());
    REQUIRE(small.add(make_delegate<&multiply>()).is_ok());
    CHECK(small.full());
    CHECK(small.add(make_delegate<&subtract>()).error() == error_code::capacity_exceeded);

    // The operator form cannot return the failure, so it is reported
    small += make_delegate<&subtract>();
    CHECK(small.size() == 2);
    const auto& handler = error::get_global_error_handler();
    REQUIRE(handler.get_error_count() == 1);
    CHECK(handler.get_last_error().event == error::error_event::list_overflow);
    CHECK(handler.get_last_error().code == error_code::capacity_exceeded);

    multicast_delegate<int(int, int), 2> other = make_delegate<&divide>();
    CHECK(other.add(small).error() == error_code::capacity_exceeded);
    CHECK(other.size() == 1);
}

TEST_CASE("multicast_delegate: equality and contains")
{
    const math_operation first = math_operation::create<&add>() + math_operation::create<&multiply>();
    math_operation second = math_operation::create<&add>();
    CHECK(first != second);

    second += make_delegate<&multiply>();
    CHECK(first == second);
    CHECK(first.contains(make_delegate<&multiply>()));
    CHECK_FALSE(first.contains(make_delegate<&divide>()));

    const math_operation difference = first - math_operation::create<&multiply>();
    CHECK(difference == math_operation::create<&add>());
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: members may change the list during isolated invocation")
{
    trace_operation list;
    auto unsubscribe_all = [&list](int value) {
        trace().push_back("X" + std::to_string(value));
        list.clear();
    };
    list += make_delegate(unsubscribe_all);
    list += make_delegate<&trace_a>();

    const invocation_report report = list.invoke_each(9);
    CHECK(report.invoked == 2);
    CHECK(trace() == std::vector<std::string>{"X9", "A9"});
    CHECK(list.empty());
}

TEST_CASE_FIXTURE(trace_fixture, "multicast_delegate: members may change the list during a combined call")
{
    trace_operation list;
    auto unsubscribe_all = [&list](int value) {
        trace().push_back("X" + std::to_string(value));
        list.clear();
    };
    list += make_delegate(unsubscribe_all);
    list += make_delegate<&trace_a>();

    REQUIRE(list.invoke(9).is_ok());
    CHECK(trace() == std::vector<std::string>{"X9", "A9"});
    CHECK(list.empty());

    // The next call sees the cleared list
    CHECK(list.invoke(9).error() == error_code::empty_invocation_list);
    CHECK(trace().size() == 2);
}
