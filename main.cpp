#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/SoulDosApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/MockHal.hpp"

using namespace souldos;

int main(int argc, char** argv) {
    auto exitCode = app::SoulDosApp::HandleInvocation(std::vector<std::string>(argv + 1, argv + argc),
                                                      std::cout, std::cerr);
    if (exitCode) {
        return *exitCode;
    }

    try {
        infrastructure::ShellSettings settings = infrastructure::ConfigLoader::LoadDefault();
        auto hal = std::make_unique<infrastructure::MockHal>(
            domain::ModuleManifest::Default(), settings.halDiagnostics ? &std::cout : nullptr);

        app::SoulDosApp shell(std::move(hal), settings, std::cin, std::cout);
        return shell.Run();
    } catch (const std::exception& e) {
        std::cerr << "[SoulDOS] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
