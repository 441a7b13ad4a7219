/**
 * @file ShellService.cpp
 * @brief Implementation of the ShellService class.
 */

#include "application/ShellService.hpp"
#include "application/CommandCatalog.hpp"
#include <ctime>
#include <iomanip>

namespace souldos::application {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

ShellService::ShellService(const domain::Hal& hal, IntegrityCheckService& integrity, std::ostream& out, Clock clock)
    : m_hal(hal), m_integrity(integrity), m_out(out), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
}

void ShellService::Execute(const Command& command) {
    switch (command.kind) {
    case CommandKind::Help:
        PrintHelp(command);
        break;
    case CommandKind::Version:
        m_out << CommandCatalog::VersionText() << "\n";
        break;
    case CommandKind::Ver:
        m_out << "SoulWare CLI Version 0.0.1 (Alpha)\n";
        break;
    case CommandKind::Date:
        PrintDate("%Y-%m-%d");
        break;
    case CommandKind::Time:
        PrintDate("%H:%M:%S");
        break;
    case CommandKind::ClearScreen:
        ClearScreen();
        break;
    case CommandKind::List:
        m_out << "Placeholder: Listing directory contents or module status...\n";
        break;
    case CommandKind::Status:
        ShowStatus();
        break;
    case CommandKind::CheckModuleIntegrity:
        CheckModuleIntegrity(command);
        break;
    case CommandKind::SystemIntegrityCheck:
        m_integrity.RunSystemCheck();
        break;
    case CommandKind::Ping:
        m_out << "pong!\n";
        break;
    case CommandKind::InitNpu:
        InitNpu();
        break;
    case CommandKind::MapEmotion:
        MapEmotion();
        break;
    case CommandKind::CollapseTruth:
        CollapseTruth(command);
        break;
    case CommandKind::RunOnnxTest:
        RunOnnxTest(command);
        break;
    }
}

void ShellService::PrintHelp(const Command& command) {
    if (!command.hasArg(0)) {
        m_out << CommandCatalog::HelpText();
        return;
    }
    auto text = CommandCatalog::CommandHelp(command.arg(0));
    if (text) {
        m_out << *text;
    } else {
        m_out << "error: no help available for unrecognized command '" << command.arg(0) << "'\n";
    }
}

void ShellService::PrintDate(const char* format) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(m_clock()));
    m_out << std::put_time(&tm, format) << "\n";
}

void ShellService::ClearScreen() {
    m_out << "\x1B[2J\x1B[H";
    m_out.flush();
}

void ShellService::ShowStatus() {
    try {
        std::string status = m_hal.getSystemStatus();
        m_out << status << "\n";
    } catch (const domain::HalError& e) {
        m_out << "Error getting system status: " << e.what() << "\n";
    }
}

void ShellService::CheckModuleIntegrity(const Command& command) {
    if (!command.hasArg(0)) {
        m_out << "Usage: check-module-integrity <module_name>\n";
        return;
    }
    m_integrity.CheckModule(command.arg(0));
}

void ShellService::InitNpu() {
    try {
        std::string message = m_hal.initializeNpu();
        m_out << message << "\n";
    } catch (const domain::HalError& e) {
        m_out << "Error initializing NPU: " << e.what() << "\n";
    }
}

void ShellService::MapEmotion() {
    m_out << "\nFetching emotional map from Tensor Field...\n";
    try {
        auto entries = m_hal.getEmotionalMap();
        m_out << "Current Emotional Map in Tensor Field:\n";
        if (entries.empty()) {
            m_out << "  Emotional map is currently clear.\n";
            return;
        }
        for (const auto& entry : entries) {
            m_out << "  - " << entry << "\n";
        }
    } catch (const domain::HalError& e) {
        m_out << "Error fetching emotional map: " << e.what() << "\n";
    }
}

void ShellService::CollapseTruth(const Command& command) {
    const std::string& emotion = command.arg(0);
    const std::string& mode = command.arg(1);
    const std::string& time = command.arg(2);

    m_out << "\nAttempting to collapse truth waveform for emotion '" << emotion << "', mode '" << mode
          << "', time '" << time << "'...\n";
    m_out.flush();
    try {
        std::string node = m_hal.collapseTruthWaveform(emotion, mode, time);
        m_out << "Tensor Waveform Collapse Result: '" << node << "'\n";
    } catch (const domain::HalError& e) {
        m_out << "Error during truth collapse: " << e.what() << "\n";
    }
}

void ShellService::RunOnnxTest(const Command& command) {
    domain::TensorData input{command.arg(1)};
    try {
        domain::TensorData output = m_hal.runOnnxModel(command.arg(0), input);
        m_out << "ONNX Model Output: " << output.info << "\n";
    } catch (const domain::HalError& e) {
        m_out << "Error running ONNX model: " << e.what() << "\n";
    }
}

} // namespace souldos::application
