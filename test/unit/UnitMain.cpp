//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runEventTests();
bool runHeartbeatGateTests();
bool runTrackerArgumentsTests();
bool runProcessLauncherTests();
bool runTelemetryTests();
bool runDispatcherTests();
bool runLspJsonRpcFuzzTests();
bool runLspServerConfigTests();
bool runLspTaskSchedulerTests();
bool runLspServerTests();
bool runToolchainTests();

int main()
{
    bool ok = true;
    ok      = runEventTests() && ok;
    ok      = runHeartbeatGateTests() && ok;
    ok      = runTrackerArgumentsTests() && ok;
    ok      = runProcessLauncherTests() && ok;
    ok      = runTelemetryTests() && ok;
    ok      = runDispatcherTests() && ok;
    ok      = runLspJsonRpcFuzzTests() && ok;
    ok      = runLspServerConfigTests() && ok;
    ok      = runLspTaskSchedulerTests() && ok;
    ok      = runLspServerTests() && ok;
    ok      = runToolchainTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
