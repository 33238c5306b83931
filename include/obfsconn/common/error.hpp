#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <utility>

namespace obfsconn::common {

// Error value carried by every fallible operation.
// code identifies the failure, detail adds context (an address, a status line).
class Error {
public:
    Error() = default;
    Error(std::error_code code, std::string detail = {})
        : code_(code), detail_(std::move(detail)) {}

    const std::error_code& code() const { return code_; }
    const std::string& detail() const { return detail_; }

    // "<code message>" or "<code message>: <detail>"
    [[nodiscard]] std::string message() const;

private:
    std::error_code code_;
    std::string detail_;
};

template<typename T>
using Result = std::expected<T, Error>;

// Shorthand for returning a failed Result
template<typename E>
std::unexpected<Error> fail(E err, std::string detail = {}) {
    return std::unexpected(Error(make_error_code(err), std::move(detail)));
}

}  // namespace obfsconn::common
