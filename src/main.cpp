#include "core/command_dispatcher.h"
#include "core/config_file.h"
#include "core/event_sink.h"
#include "core/logger.h"
#include "core/transfer_error.h"
#include "core/transfer_service.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <command> [arguments]\n"
              << "Commands:\n"
              << "  download <id> <url> <file> [-H 'Name: value']...   GET url into file\n"
              << "  upload   <id> <url> <file> [-H 'Name: value']...   PUT file to url\n"
              << "  invoke                                             read JSON commands from stdin,\n"
              << "                                                     one per line: {\"cmd\": ..., \"args\": {...}}\n"
              << "Options:\n"
              << "  --config <file>      JSON configuration file\n"
              << "  --log-file <file>    append log lines to file\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  -v, --verbose        mirror log lines to stderr\n"
              << "  -h, --help           show this message\n"
              << "Progress events and results are written to stdout as JSON lines." << std::endl;
}

/// "Name: value" -> (Name, value). Returns nullopt without a colon.
std::optional<std::pair<std::string, std::string>> parseHeaderArg(const std::string& arg) {
    auto colon = arg.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    std::string name = arg.substr(0, colon);
    std::string value = arg.substr(colon + 1);
    auto start = value.find_first_not_of(" \t");
    value = (start == std::string::npos) ? std::string{} : value.substr(start);
    return std::make_pair(name, value);
}

void applyLogging(const TransferConfig& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(Logger::parseLevel(config.log_level));
    logger.setEchoToStderr(config.log_to_stderr);
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
}

/// Emit one result event and report whether the command succeeded.
bool publishResult(EventSink& sink, const std::string& command, const json& args, const json& reply) {
    json payload = reply;
    payload["cmd"] = command;
    if (args.is_object() && args.contains("id")) {
        payload["id"] = args["id"];
    }
    sink.emit(kTransferResultEvent, payload);
    return reply.value("ok", false);
}

int runInvokeLoop(CommandDispatcher& dispatcher, EventSink& sink) {
    struct Pending {
        std::string command;
        json args;
        std::future<json> reply;
    };
    std::vector<Pending> pending;
    bool all_ok = true;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object() ||
            !message.contains("cmd") || !message["cmd"].is_string()) {
            TransferError bad(TransferErrorKind::InvalidArgument,
                "expected {\"cmd\": \"...\", \"args\": {...}}, got: " + line);
            all_ok = publishResult(sink, "", json(), json{{"ok", false}, {"error", errorToJson(bad)}})
                && all_ok;
            continue;
        }

        std::string command = message["cmd"].get<std::string>();
        json args = message.value("args", json::object());
        auto reply = dispatcher.start(command, args);
        pending.push_back(Pending{std::move(command), std::move(args), std::move(reply)});
    }

    // Transfers run concurrently; results are reported in command order.
    for (auto& p : pending) {
        all_ok = publishResult(sink, p.command, p.args, p.reply.get()) && all_ok;
    }
    return all_ok ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    bool verbose = false;

    int arg_index = 1;
    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];
        const bool has_value = arg_index + 1 < argc;

        if (option == "--config" && has_value) {
            config_path = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "--log-file" && has_value) {
            log_file = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "--log-level" && has_value) {
            log_level = argv[arg_index + 1];
            arg_index += 2;
        } else if (option == "-v" || option == "--verbose") {
            verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (arg_index >= argc) {
        printUsage(argv[0]);
        return 2;
    }

    TransferConfig config;
    if (config_path) {
        auto loaded = ConfigFile::load(*config_path);
        if (!loaded) {
            std::cerr << "Cannot read configuration: " << *config_path << std::endl;
            return 2;
        }
        config = *loaded;
    }
    if (log_file) config.log_file = *log_file;
    if (log_level) config.log_level = *log_level;
    if (verbose) config.log_to_stderr = true;
    applyLogging(config);

    const std::string command = argv[arg_index++];

    try {
        JsonLinesEventSink sink(std::cout);
        PooledTransferService service(config, sink);
        CommandDispatcher dispatcher(service);

        if (command == "invoke") {
            if (arg_index != argc) {
                printUsage(argv[0]);
                return 2;
            }
            return runInvokeLoop(dispatcher, sink);
        }

        if (command != "download" && command != "upload") {
            printUsage(argv[0]);
            return 2;
        }
        if (argc - arg_index < 3) {
            printUsage(argv[0]);
            return 2;
        }

        json args{
            {"url",      argv[arg_index + 1]},
            {"filePath", argv[arg_index + 2]},
            {"headers",  json::object()}
        };
        try {
            args["id"] = CommandDispatcher::parseId(argv[arg_index]);
        } catch (const TransferError& e) {
            std::cerr << e.what() << std::endl;
            return 2;
        }

        for (int i = arg_index + 3; i < argc; i += 2) {
            const std::string flag = argv[i];
            if (flag != "-H" || i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            auto header = parseHeaderArg(argv[i + 1]);
            if (!header) {
                std::cerr << "Invalid header (expected 'Name: value'): " << argv[i + 1] << std::endl;
                return 2;
            }
            // Repeated names: the last one wins.
            args["headers"][header->first] = header->second;
        }

        json reply = dispatcher.invoke(command, args);
        return publishResult(sink, command, args, reply) ? 0 : 1;
    } catch (const std::exception& ex) {
        Logger::instance().error(std::string("Fatal error: ") + ex.what());
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
