#include "HospitalityApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
HospitalityApp* g_app = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        HospitalityApp app;
        g_app = &app;

        // Обработчики сигналов для graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Hospitality Core Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // loadEnvironment -> configureInjection -> start -> wait -> shutdown
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "========================================" << std::endl;
        std::cout << "  Hospitality Core Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
