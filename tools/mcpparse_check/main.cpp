/// mcpparse-check: decode newline-delimited JSON-RPC messages and report
/// which ones a gateway would accept.
/// Usage: ./mcpparse-check [--mode request|response|error|message|validate] [--batch] [file...]
/// Reads stdin when no file is given.

#include "checker.hpp"
#include <mcpparse/version.hpp>
#include <aixlog.hpp>
#include <popl.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace popl;

static constexpr auto LOG_TAG = "Main";

namespace {

void init_logging(const std::string& sink, const std::string& filter_spec) {
    AixLog::Filter filter;
    std::istringstream filters(filter_spec);
    std::string filter_item;
    while (std::getline(filters, filter_item, ',')) {
        if (!filter_item.empty()) filter.add_filter(filter_item);
    }

    const std::string format = "%Y-%m-%d %H-%M-%S.#ms [#severity] (#tag_func)";
    if (sink.find("file:") == 0) {
        AixLog::Log::init<AixLog::SinkFile>(filter, sink.substr(5), format);
    } else if (sink == "stdout") {
        AixLog::Log::init<AixLog::SinkCout>(filter, format);
    } else if (sink == "stderr") {
        AixLog::Log::init<AixLog::SinkCerr>(filter, format);
    } else if (sink == "null") {
        AixLog::Log::init<AixLog::SinkNull>();
    } else {
        throw std::invalid_argument("Invalid log sink: " + sink);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    OptionParser op("Allowed options");
    auto help_switch = op.add<Switch>("h", "help", "Produce help message");
    auto version_switch = op.add<Switch>("v", "version", "Show version number");
    auto mode_option = op.add<Value<std::string>>("m", "mode", "Decode as request|response|error|message, or validate only", "message");
    auto batch_switch = op.add<Switch>("b", "batch", "Decode all lines as one all-or-nothing batch of requests");
    auto pretty_switch = op.add<Switch>("p", "pretty", "Indent JSON output");
    auto sink_option = op.add<Value<std::string>>("", "logging.sink", "log sink [null,stdout,stderr,file:<filename>]", "stderr");
    auto filter_option = op.add<Value<std::string>>("", "logging.filter",
        "log filter <tag>:<level>[,<tag>:<level>]* with tag = * or <log tag> and level = [trace,debug,info,notice,warning,error,fatal]",
        "*:info");

    try {
        op.parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        std::cout << "\n" << op << "\n";
        return 2;
    }

    if (help_switch->is_set()) {
        std::cout << op << "\n";
        return EXIT_SUCCESS;
    }
    if (version_switch->is_set()) {
        std::cout << "mcpparse-check v" << mcpparse::LIBRARY_VERSION
                  << " (JSON-RPC " << mcpparse::JSONRPC_VERSION << ")\n";
        return EXIT_SUCCESS;
    }

    try {
        init_logging(sink_option->value(), filter_option->value());

        mcpparse::Checker::Options opts;
        opts.mode = mcpparse::check_mode_from_string(mode_option->value());
        opts.batch = batch_switch->is_set();
        opts.indent = pretty_switch->is_set() ? 2 : -1;
        mcpparse::Checker checker{opts};

        mcpparse::CheckStats total;
        const auto& inputs = op.non_option_args();
        if (inputs.empty()) {
            total = checker.run(std::cin, std::cout);
        } else {
            for (const auto& path : inputs) {
                std::ifstream file(path);
                if (!file) {
                    LOG(ERROR, LOG_TAG) << "Cannot open input file: " << path << "\n";
                    return 2;
                }
                auto stats = checker.run(file, std::cout, path);
                total.messages += stats.messages;
                total.accepted += stats.accepted;
                total.rejected += stats.rejected;
            }
        }

        std::cout.flush();
        return total.all_accepted() ? EXIT_SUCCESS : 1;
    } catch (const std::exception& e) {
        LOG(ERROR, LOG_TAG) << "Exception: " << e.what() << "\n";
        return 2;
    }
}
