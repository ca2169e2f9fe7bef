#pragma once
#include <cstring>
#include <string>
#include <utility>

namespace janitor {

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
    // "<what>: <strerror(e)>"
    static Result FromErrno(int e, const std::string& what) {
        return Fail(e, what + ": " + std::strerror(e));
    }
};

} // namespace janitor
