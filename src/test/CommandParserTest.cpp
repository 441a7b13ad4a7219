#include <cassert>
#include <iostream>
#include <string>

#include "application/CommandCatalog.hpp"
#include "application/CommandParser.hpp"

using namespace souldos::application;

namespace {

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Command Parser Test..." << std::endl;

    auto tokens = CommandParser::Tokenize("  collapse-truth\tJoy   focused  now ");
    assert(tokens.size() == 4);
    assert(tokens[0] == "collapse-truth" && tokens[3] == "now");

    std::string error;

    // Aliases resolve to the same kind.
    assert(CommandParser::Parse("cls", error)->kind == CommandKind::ClearScreen);
    assert(CommandParser::Parse("clear", error)->kind == CommandKind::ClearScreen);
    assert(CommandParser::Parse("ls", error)->kind == CommandKind::List);
    assert(CommandParser::Parse("dir", error)->kind == CommandKind::List);
    assert(CommandParser::Parse("status", error)->kind == CommandKind::Status);
    assert(CommandParser::Parse("mem", error)->kind == CommandKind::Status);
    assert(CommandParser::Parse("--help", error)->kind == CommandKind::Help);
    assert(CommandParser::Parse("-V", error)->kind == CommandKind::Version);

    auto check = CommandParser::Parse("check-module-integrity TensorMemoryDriver", error);
    assert(check && check->kind == CommandKind::CheckModuleIntegrity);
    assert(check->arg(0) == "TensorMemoryDriver");

    // Module name is optional at parse time.
    auto bareCheck = CommandParser::Parse("check-module-integrity", error);
    assert(bareCheck && !bareCheck->hasArg(0));

    auto collapse = CommandParser::Parse("collapse-truth Joy focused t0", error);
    assert(collapse && collapse->kind == CommandKind::CollapseTruth);
    assert(collapse->arguments.size() == 3 && collapse->arg(1) == "focused");

    auto onnx = CommandParser::Parse("run-onnx-test model.onnx 1x3x224x224", error);
    assert(onnx && onnx->kind == CommandKind::RunOnnxTest);
    assert(onnx->arg(0) == "model.onnx" && onnx->arg(1) == "1x3x224x224");

    // Tokens are case-sensitive.
    assert(!CommandParser::Parse("PING", error));
    assert(Contains(error, "unrecognized command 'PING'"));

    assert(!CommandParser::Parse("frobnicate now", error));
    assert(Contains(error, "unrecognized command 'frobnicate'"));
    assert(Contains(error, "Type 'help'"));

    assert(!CommandParser::Parse("collapse-truth Joy", error));
    assert(Contains(error, "required arguments were not provided"));
    assert(Contains(error, "<mode>") && Contains(error, "<time>"));
    assert(!Contains(error, "<emotion>\n"));
    assert(Contains(error, "Usage: collapse-truth <emotion> <mode> <time>"));

    assert(!CommandParser::Parse("run-onnx-test", error));
    assert(Contains(error, "<model_path>") && Contains(error, "<input_info>"));

    assert(!CommandParser::Parse("ping pong", error));
    assert(Contains(error, "unexpected argument 'pong' found"));

    assert(!CommandParser::Parse("check-module-integrity A B", error));
    assert(Contains(error, "unexpected argument 'B' found"));
    assert(Contains(error, "Usage: check-module-integrity [module_name]"));

    assert(CommandParser::Parse("ping", error));
    assert(error.empty());

    // Catalog texts.
    std::string help = CommandCatalog::HelpText();
    assert(Contains(help, "CLI for SoulWare OS"));
    assert(Contains(help, "Version: 0.0.1-alpha"));
    for (const auto& spec : CommandCatalog::All()) {
        assert(Contains(help, spec.usage()));
    }
    assert(CommandCatalog::VersionText() == "SoulDOS 0.0.1-alpha");
    assert(CommandCatalog::CommandHelp("ping"));
    assert(!CommandCatalog::CommandHelp("pong"));

    std::cout << "[PASS] Command Parser Test." << std::endl;
    return 0;
}
