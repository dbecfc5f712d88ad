#pragma once
#include <mcpparse/codec.hpp>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace mcpparse {

enum class CheckMode {
    Request,
    Response,
    Error,
    Message,
    Validate,
};

std::string check_mode_to_string(CheckMode mode);
/// Throws std::invalid_argument for unknown names.
CheckMode check_mode_from_string(const std::string& s);

struct CheckStats {
    size_t messages = 0;
    size_t accepted = 0;
    size_t rejected = 0;

    bool all_accepted() const { return rejected == 0; }
};

/// Checks newline-delimited JSON-RPC messages, one per line.
///
/// Every non-blank line produces one output line: the canonical JSON of the
/// decoded record, or the error response a gateway would send back for it.
/// In Validate mode the output is the admission filter's verdict instead.
/// In batch mode all lines form a single all-or-nothing batch of requests.
class Checker {
public:
    struct Options {
        CheckMode mode = CheckMode::Message;
        bool batch = false;
        int indent = -1;
    };

    explicit Checker(Options opts);

    CheckStats run(std::istream& in, std::ostream& out, const std::string& source = "<stdin>");

private:
    bool check_line(std::string_view line, const std::string& where, std::ostream& out) const;
    CheckStats run_batch(std::istream& in, std::ostream& out, const std::string& source) const;

    Options opts_;
};

} // namespace mcpparse
