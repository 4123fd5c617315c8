#include "MonolithApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
monolith::MonolithApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        monolith::MonolithApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Modular Monolith Starting" << std::endl;
        std::cout << "  Press Ctrl+D or type 'quit' to stop" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "\n========================================" << std::endl;
        std::cout << "  Modular Monolith Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
