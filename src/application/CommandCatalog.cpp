#include "application/CommandCatalog.hpp"
#include <algorithm>
#include <sstream>

namespace souldos::application {

std::string CommandSpec::usage() const {
    std::string out = name;
    for (const auto& arg : requiredArgs) {
        out += " <" + arg + ">";
    }
    for (const auto& arg : optionalArgs) {
        out += " [" + arg + "]";
    }
    return out;
}

const std::vector<CommandSpec>& CommandCatalog::All() {
    static const std::vector<CommandSpec> commands = {
        {"help", CommandKind::Help, {}, {"command"}, "Displays help information"},
        {"ver", CommandKind::Ver, {}, {}, "Displays version information"},
        {"date", CommandKind::Date, {}, {}, "Displays the current date"},
        {"time", CommandKind::Time, {}, {}, "Displays the current time"},
        {"cls", CommandKind::ClearScreen, {}, {}, "Clears the screen"},
        {"clear", CommandKind::ClearScreen, {}, {}, "Clears the screen"},
        {"ls", CommandKind::List, {}, {}, "Lists directory contents or module status (placeholder)"},
        {"dir", CommandKind::List, {}, {}, "Lists directory contents or module status (placeholder)"},
        {"status", CommandKind::Status, {}, {}, "Displays system status or memory resonance using HAL"},
        {"mem", CommandKind::Status, {}, {}, "Displays system status or memory resonance using HAL"},
        {"check-module-integrity", CommandKind::CheckModuleIntegrity, {}, {"module_name"},
         "Checks the integrity of a module using HAL"},
        {"system-integrity-check", CommandKind::SystemIntegrityCheck, {}, {},
         "Performs a system integrity check using HAL"},
        {"ping", CommandKind::Ping, {}, {}, "Pings the system"},
        {"init-npu", CommandKind::InitNpu, {}, {}, "Initializes the NPU via HAL"},
        {"map-emotion", CommandKind::MapEmotion, {}, {}, "Gets the emotional map from HAL"},
        {"collapse-truth", CommandKind::CollapseTruth, {"emotion", "mode", "time"}, {},
         "Collapses a truth waveform via HAL"},
        {"run-onnx-test", CommandKind::RunOnnxTest, {"model_path", "input_info"}, {},
         "Runs a test ONNX model via HAL"},
    };
    return commands;
}

const CommandSpec* CommandCatalog::Find(const std::string& name) {
    const auto& commands = All();
    auto it = std::find_if(commands.begin(), commands.end(),
                           [&name](const CommandSpec& spec) { return spec.name == name; });
    return it == commands.end() ? nullptr : &*it;
}

std::string CommandCatalog::HelpText() {
    const auto& commands = All();
    std::size_t width = 0;
    for (const auto& spec : commands) {
        width = std::max(width, spec.usage().size());
    }

    std::ostringstream ss;
    ss << kAbout << "\n";
    ss << "Version: " << kVersion << "\n\n";
    ss << "Usage: <command> [arguments]\n\n";
    ss << "Commands:\n";
    for (const auto& spec : commands) {
        std::string usage = spec.usage();
        ss << "  " << usage << std::string(width - usage.size() + 2, ' ') << spec.description << "\n";
    }
    std::string quit = "exit, quit";
    ss << "  " << quit << std::string(width > quit.size() ? width - quit.size() + 2 : 2, ' ')
       << "Leaves the shell\n";
    return ss.str();
}

std::optional<std::string> CommandCatalog::CommandHelp(const std::string& name) {
    const CommandSpec* spec = Find(name);
    if (!spec) {
        return std::nullopt;
    }
    return spec->description + "\n\nUsage: " + spec->usage() + "\n";
}

std::string CommandCatalog::VersionText() {
    return std::string(kProgramName) + " " + kVersion;
}

} // namespace souldos::application
