#include "ExecDbApp.hpp"
#include <csignal>
#include <iostream>

namespace {

ExecDbApp* g_app = nullptr;

// Только выставляет флаг: прогрев останавливается между шагами
void onTerminate(int)
{
    if (g_app)
    {
        g_app->stop();
    }
}

const char* describeExitCode(int code)
{
    switch (code)
    {
        case 0: return "clean";
        case 2: return "residual state found";
        default: return "failed";
    }
}

} // namespace

int main()
{
    int code = 1;

    try
    {
        ExecDbApp app;
        g_app = &app;
        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);

        code = app.run();
        g_app = nullptr;
    }
    catch (const std::exception& e)
    {
        g_app = nullptr;
        std::cerr << "[main] Warm-up aborted: " << e.what() << std::endl;
    }

    std::cout << "[main] Exit " << code << " (" << describeExitCode(code) << ")" << std::endl;
    return code;
}
