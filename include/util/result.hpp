#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace ddi {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }

    // Captures errno at the call site: "<context>: <strerror>".
    static Result FromErrno(const std::string& context) {
        const int e = errno;
        return Fail(e, context + ": " + std::strerror(e));
    }
};

} // namespace ddi
