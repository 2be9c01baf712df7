#include <emDelegate/emDelegate.hpp>
#include <emDelegate/demo/events_demo.hpp>

using namespace emDelegate;

int main() {
    platform::logf("emDelegate %s on %s", version(), platform::get_platform_info().name);
    demo::run_all();
    return 0;
}
