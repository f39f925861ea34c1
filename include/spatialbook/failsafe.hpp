#ifndef SPATIALBOOK_FAILSAFE_HPP
#define SPATIALBOOK_FAILSAFE_HPP

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace spatialbook::failsafe {

    // Runs fn and returns the failure text of any exception it raised.
    template <typename F>
    std::optional<std::string> capture(F&& fn) noexcept {
        try {
            std::forward<F>(fn)();
            return std::nullopt;
        } catch (const std::exception& ex) {
            try {
                return std::string(ex.what());
            } catch (...) {
                return std::nullopt;
            }
        } catch (...) {
            try {
                return std::string("unknown exception");
            } catch (...) {
                return std::nullopt;
            }
        }
    }

    template <typename F, typename OnError>
    [[nodiscard]] bool guard(F&& fn, OnError&& on_error, std::string_view context) noexcept {
        bool failed  = true;
        auto failure = capture([&] {
            std::forward<F>(fn)();
            failed = false;
        });
        if (!failed) {
            return true;
        }
        try {
            std::forward<OnError>(on_error)(context, failure ? std::string_view(*failure) : std::string_view("out of memory"));
        } catch (...) {}
        return false;
    }

} // namespace spatialbook::failsafe

#endif // SPATIALBOOK_FAILSAFE_HPP
