#ifndef SPATIALBOOK_LOGGING_HPP
#define SPATIALBOOK_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace spatialbook {

    using DebugLogSink = void (*)(std::string_view message);
    using ErrorLogSink = void (*)(std::string_view message);

    std::string format_log_entry(std::string_view context, std::string_view message);
    std::string format_debug_entry(std::string_view context, std::string_view message);
    std::string format_log_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    // Sinks may be invoked from the autosave drain thread.
    void        set_debug_log_sink(DebugLogSink sink);
    void        clear_debug_log_sink();
    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_error_log_sink(ErrorLogSink sink);
    void        clear_error_log_sink();
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        stderr_log_sink(std::string_view message);

} // namespace spatialbook

#endif // SPATIALBOOK_LOGGING_HPP
