#ifndef MORK_UTILS_LOGGING_H
#define MORK_UTILS_LOGGING_H

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "expect.h"
#include "mork/options.h"
#include "mork/status.h"

namespace Mork {

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

class System {
public:
    explicit System(const Options &options);
    [[nodiscard]] auto create_log(const std::string &name) const -> LogPtr;

private:
    LogSink m_sink;
};

class ThreePartMessage {
public:
    ThreePartMessage() = default;

    template<class... Args>
    auto set_primary(std::string_view format, Args &&...args) -> void
    {
        return set_text(PRIMARY, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    auto set_detail(std::string_view format, Args &&...args) -> void
    {
        return set_text(DETAIL, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    auto set_hint(std::string_view format, Args &&...args) -> void
    {
        return set_text(HINT, format, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto text() const -> std::string;

private:
    static constexpr Size PRIMARY {0};
    static constexpr Size DETAIL {1};
    static constexpr Size HINT {2};

    template<class... Args>
    auto set_text(Size index, std::string_view format, Args &&...args) -> void
    {
        m_text[index] = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    }

    std::string m_text[3];
};

// Builds an error message, writes it to a log, and wraps it in a Status.
class LogMessage {
public:
    explicit LogMessage(Log &logger)
        : m_logger {&logger}
    {}

    template<class... Args>
    auto set_primary(std::string_view format, Args &&...args) -> void
    {
        return m_message.set_primary(format, std::forward<Args>(args)...);
    }

    template<class... Args>
    auto set_detail(std::string_view format, Args &&...args) -> void
    {
        return m_message.set_detail(format, std::forward<Args>(args)...);
    }

    template<class... Args>
    auto set_hint(std::string_view format, Args &&...args) -> void
    {
        return m_message.set_hint(format, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto lexical_error(spdlog::level::level_enum = spdlog::level::err) const -> Status;
    [[nodiscard]] auto syntax_error(spdlog::level::level_enum = spdlog::level::err) const -> Status;
    [[nodiscard]] auto unresolved_reference(spdlog::level::level_enum = spdlog::level::err) const -> Status;
    [[nodiscard]] auto invalid_identifier(spdlog::level::level_enum = spdlog::level::err) const -> Status;
    [[nodiscard]] auto group_mismatch(spdlog::level::level_enum = spdlog::level::err) const -> Status;
    auto log(spdlog::level::level_enum = spdlog::level::err) const -> std::string;

private:
    ThreePartMessage m_message;
    Log *m_logger {};
};

auto append_escaped_string(std::string &out, const Slice &value) -> void;
auto escape_string(const Slice &value) -> std::string;

} // namespace Mork

#endif // MORK_UTILS_LOGGING_H
