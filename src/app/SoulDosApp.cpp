/**
 * @file SoulDosApp.cpp
 * @brief Implementation of the SoulDosApp class.
 */
#include "app/SoulDosApp.hpp"

#include "application/CommandCatalog.hpp"
#include "application/CommandParser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace souldos::app {

namespace {

std::string Trim(const std::string& value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(value.begin(), value.end(), notSpace);
    auto last = std::find_if(value.rbegin(), value.rend(), notSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

SoulDosApp::SoulDosApp(std::unique_ptr<domain::Hal> hal, infrastructure::ShellSettings settings,
                       std::istream& in, std::ostream& out)
    : m_settings(std::move(settings)), m_in(in), m_out(out) {
    // Composition Root
    m_services.hal = std::move(hal);
    m_services.integrityService = std::make_unique<application::IntegrityCheckService>(*m_services.hal, m_out);
    m_services.shellService = std::make_unique<application::ShellService>(
        *m_services.hal, *m_services.integrityService, m_out);
}

void SoulDosApp::PrintBanner() {
    m_out << "***************************************************\n";
    m_out << "*                                                 *\n";
    m_out << "*        Welcome to SoulWare CLI (SoulDOS)        *\n";
    m_out << "*                  Version 0.0.1-alpha            *\n";
    m_out << "*                                                 *\n";
    m_out << "***************************************************\n";
    m_out << "Initializing System...\n";
}

void SoulDosApp::Init() {
    PrintBanner();

    m_out << "\nPerforming initial system integrity check...\n";
    m_services.integrityService->RunBootChecks();

    m_out << "\nFetching initial system status...\n";
    try {
        std::string status = m_services.hal->getSystemStatus();
        m_out << "System Status: " << status << "\n";
    } catch (const domain::HalError& e) {
        m_out << "Failed to get status: " << e.what() << "\n";
    }

    m_out << "\nAttempting to initialize NPU...\n";
    try {
        std::string message = m_services.hal->initializeNpu();
        m_out << message << "\n";
    } catch (const domain::HalError& e) {
        m_out << "NPU Initialization Failed: " << e.what() << "\n";
    }

    m_out << "\nSystem Initialized. Type 'help' for available commands.\n";
}

bool SoulDosApp::HandleLine(const std::string& line) {
    std::string trimmed = Trim(line);
    if (trimmed.empty()) {
        return true;
    }

    std::string lowered = ToLower(trimmed);
    if (lowered == "exit" || lowered == "quit") {
        return false;
    }

    std::string error;
    auto command = application::CommandParser::Parse(trimmed, error);
    if (!command) {
        m_out << error << "\n";
        return true;
    }

    m_services.shellService->Execute(*command);
    return true;
}

std::optional<int> SoulDosApp::HandleInvocation(const std::vector<std::string>& args, std::ostream& out,
                                                std::ostream& err) {
    if (args.empty()) {
        return std::nullopt;
    }
    bool isHelp = args[0] == "-h" || args[0] == "--help";
    bool isVersion = args[0] == "-V" || args[0] == "--version";

    // Flags take no values; anything after them is rejected.
    if (args.size() == 1 && isHelp) {
        out << application::CommandCatalog::HelpText();
        return 0;
    }
    if (args.size() == 1 && isVersion) {
        out << application::CommandCatalog::VersionText() << std::endl;
        return 0;
    }

    const std::string& offending = (isHelp || isVersion) ? args[1] : args[0];
    err << "error: unexpected argument '" << offending << "' found\n\nUsage: souldos [--help | --version]"
        << std::endl;
    return 2;
}

int SoulDosApp::Run() {
    Init();

    std::string line;
    while (true) {
        m_out << "\n" << m_settings.prompt;
        m_out.flush();

        if (!std::getline(m_in, line)) {
            if (m_in.eof()) {
                std::cerr << "[SoulDosApp] End of input. Leaving shell." << std::endl;
            } else {
                std::cerr << "[SoulDosApp] Failed to read input. Leaving shell." << std::endl;
            }
            break;
        }

        if (!HandleLine(line)) {
            break;
        }
    }

    m_out.flush();
    return 0;
}

} // namespace souldos::app
