#include "checker.hpp"
#include <mcpparse/json_rpc.hpp>
#include <aixlog.hpp>
#include <stdexcept>
#include <vector>

namespace mcpparse {

static constexpr auto LOG_TAG = "Checker";

namespace {

std::string describe(const Request& r) {
    return "request '" + r.method + "', id " + to_string(r.id);
}

std::string describe(const Response& r) {
    return "response, id " + to_string(r.id);
}

std::string describe(const ErrorResponse& r) {
    return "error response " + std::to_string(r.error.code) + ", id " + to_string(r.id);
}

std::string describe(const Message& m) {
    return std::visit([](const auto& v) { return describe(v); }, m);
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

template<typename T>
bool emit(const DecodeResult<T>& result, const std::string& where, int indent, std::ostream& out) {
    if (!result) {
        LOG(WARNING, LOG_TAG) << where << ": " << result.error() << "\n";
        out << Codec::serialize(to_error_response(result.error()), indent) << "\n";
        return false;
    }
    LOG(DEBUG, LOG_TAG) << where << ": " << describe(result.value()) << "\n";
    out << Codec::serialize(result.value(), indent) << "\n";
    return true;
}

} // anonymous namespace

std::string check_mode_to_string(CheckMode mode) {
    switch (mode) {
        case CheckMode::Request:  return "request";
        case CheckMode::Response: return "response";
        case CheckMode::Error:    return "error";
        case CheckMode::Message:  return "message";
        case CheckMode::Validate: return "validate";
    }
    return "message";
}

CheckMode check_mode_from_string(const std::string& s) {
    if (s == "request")  return CheckMode::Request;
    if (s == "response") return CheckMode::Response;
    if (s == "error")    return CheckMode::Error;
    if (s == "message")  return CheckMode::Message;
    if (s == "validate") return CheckMode::Validate;
    throw std::invalid_argument("Unknown check mode: " + s);
}

Checker::Checker(Options opts) : opts_(opts) {
    if (opts_.batch && opts_.mode != CheckMode::Request) {
        throw std::invalid_argument("Batch checking requires request mode");
    }
}

CheckStats Checker::run(std::istream& in, std::ostream& out, const std::string& source) {
    if (opts_.batch) {
        return run_batch(in, out, source);
    }

    CheckStats stats;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) continue;
        ++stats.messages;
        std::string where = source + ":" + std::to_string(line_no);
        if (check_line(strip_cr(line), where, out)) {
            ++stats.accepted;
        } else {
            ++stats.rejected;
        }
    }

    LOG(INFO, LOG_TAG) << source << ": " << stats.messages << " message(s), "
                       << stats.accepted << " accepted, " << stats.rejected << " rejected\n";
    return stats;
}

bool Checker::check_line(std::string_view line, const std::string& where, std::ostream& out) const {
    switch (opts_.mode) {
        case CheckMode::Request:
            return emit(Codec::decode_request(line), where, opts_.indent, out);
        case CheckMode::Response:
            return emit(Codec::decode_response(line), where, opts_.indent, out);
        case CheckMode::Error:
            return emit(Codec::decode_error_response(line), where, opts_.indent, out);
        case CheckMode::Message:
            return emit(Codec::decode(line), where, opts_.indent, out);
        case CheckMode::Validate: {
            bool valid = Codec::is_valid(line);
            if (!valid) {
                LOG(WARNING, LOG_TAG) << where << ": rejected by admission filter\n";
            }
            out << (valid ? "true" : "false") << "\n";
            return valid;
        }
    }
    return false;
}

CheckStats Checker::run_batch(std::istream& in, std::ostream& out, const std::string& source) const {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) continue;
        lines.emplace_back(strip_cr(line));
    }

    CheckStats stats;
    stats.messages = lines.size();

    auto batch = Codec::decode_request_batch(lines);
    if (!batch) {
        LOG(WARNING, LOG_TAG) << source << ": batch of " << lines.size()
                              << " rejected: " << batch.error() << "\n";
        out << Codec::serialize(to_error_response(batch.error()), opts_.indent) << "\n";
        stats.rejected = 1;
        return stats;
    }

    for (const auto& req : batch.value()) {
        out << Codec::serialize(req, opts_.indent) << "\n";
    }
    stats.accepted = batch.value().size();
    LOG(INFO, LOG_TAG) << source << ": batch of " << stats.accepted << " request(s) accepted\n";
    return stats;
}

} // namespace mcpparse
