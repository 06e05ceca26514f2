#include "logging.h"
#include <algorithm>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace Mork {

System::System(const Options &options)
{
    spdlog::level::level_enum level;

    switch (options.log_level) {
        case LogLevel::TRACE:
            level = spdlog::level::trace;
            break;
        case LogLevel::INFO:
            level = spdlog::level::info;
            break;
        case LogLevel::WARN:
            level = spdlog::level::warn;
            break;
        case LogLevel::ERROR:
            level = spdlog::level::err;
            break;
        default:
            level = spdlog::level::off;
            m_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    }

    if (level != spdlog::level::off) {
        switch (options.log_target) {
            case LogTarget::STDOUT:
                m_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
                break;
            case LogTarget::STDERR:
                m_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
                break;
            case LogTarget::STDOUT_COLOR:
                m_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                break;
            case LogTarget::STDERR_COLOR:
                m_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                break;
            default:
                MORK_EXPECT_FALSE(options.log_path.is_empty());
                m_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.log_path.to_string(),
                    std::clamp(options.max_log_size, MINIMUM_LOG_MAX_SIZE, MAXIMUM_LOG_MAX_SIZE),
                    std::clamp(options.max_log_files, MINIMUM_LOG_MAX_FILES, MAXIMUM_LOG_MAX_FILES));
        }
    }
    m_sink->set_level(level);
}

auto System::create_log(const std::string &name) const -> LogPtr
{
    MORK_EXPECT_FALSE(name.empty());
    auto log = std::make_shared<Log>(name, m_sink);
    log->set_level(spdlog::level::trace);
    return log;
}

auto ThreePartMessage::text() const -> std::string
{
    MORK_EXPECT_FALSE(m_text[PRIMARY].empty());
    std::string message {m_text[PRIMARY]};

    if (!m_text[DETAIL].empty())
        message = fmt::format("{}: {}", message, m_text[DETAIL]);

    if (!m_text[HINT].empty())
        message = fmt::format("{} ({})", message, m_text[HINT]);

    return message;
}

auto LogMessage::lexical_error(spdlog::level::level_enum level) const -> Status
{
    return Status::lexical_error(log(level));
}

auto LogMessage::syntax_error(spdlog::level::level_enum level) const -> Status
{
    return Status::syntax_error(log(level));
}

auto LogMessage::unresolved_reference(spdlog::level::level_enum level) const -> Status
{
    return Status::unresolved_reference(log(level));
}

auto LogMessage::invalid_identifier(spdlog::level::level_enum level) const -> Status
{
    return Status::invalid_identifier(log(level));
}

auto LogMessage::group_mismatch(spdlog::level::level_enum level) const -> Status
{
    return Status::group_mismatch(log(level));
}

auto LogMessage::log(spdlog::level::level_enum level) const -> std::string
{
    auto message = m_message.text();
    m_logger->log(level, message);
    return message;
}

auto append_escaped_string(std::string &out, const Slice &value) -> void
{
    for (Size i {}; i < value.size(); ++i) {
        const auto chr = value[i];
        if (chr >= ' ' && chr <= '~') {
            out.push_back(chr);
        } else {
            char buffer[10];
            std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned>(chr) & 0xFF);
            out.append(buffer);
        }
    }
}

auto escape_string(const Slice &value) -> std::string
{
    std::string out;
    append_escaped_string(out, value);
    return out;
}

} // namespace Mork
