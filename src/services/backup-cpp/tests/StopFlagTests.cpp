#include "StopFlag.hpp"
#include "TestSupport.hpp"

#include <csignal>

int main() {
    ResetStop();
    if (StopRequested()) {
        return Fail("Stop flag should start cleared.");
    }

    RequestStop();
    if (!StopRequested()) {
        return Fail("RequestStop did not raise the flag.");
    }
    ResetStop();
    if (StopRequested()) {
        return Fail("ResetStop did not clear the flag.");
    }

    InstallStopHandlers();
    if (std::raise(SIGINT) != 0) {
        return Fail("Could not deliver SIGINT.");
    }
    if (!StopRequested()) {
        return Fail("SIGINT should raise the stop flag instead of ending the process.");
    }
    ResetStop();

    if (std::raise(SIGTERM) != 0 || !StopRequested()) {
        return Fail("SIGTERM should raise the stop flag.");
    }
    ResetStop();

    return 0;
}
