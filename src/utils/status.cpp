#include "mork/status.h"

namespace Mork {

static auto maybe_copy_data(const Byte *data) -> std::unique_ptr<Byte[]>
{
    // Status is OK, so there isn't anything to copy.
    if (data == nullptr) {
        return nullptr;
    }
    // The first byte is the code, which is never zero, followed by a null-terminated message.
    const auto total_size = 1 + std::char_traits<Byte>::length(data + 1) + 1;
    auto copy = std::make_unique<Byte[]>(total_size);
    std::memcpy(copy.get(), data, total_size);
    return copy;
}

Status::Status(Code code, const Slice &what)
    : m_data {std::make_unique<Byte[]>(what.size() + 2 * sizeof(Byte))}
{
    auto *ptr = m_data.get();

    // The first byte holds the status type.
    *ptr++ = static_cast<Byte>(code);

    // The rest holds the message, plus a '\0'. std::make_unique<Byte[]>() performs value initialization, so the
    // byte is already zeroed out.
    std::memcpy(ptr, what.data(), what.size());
}

Status::Status(const Status &rhs)
    : m_data {maybe_copy_data(rhs.m_data.get())}
{}

Status::Status(Status &&rhs) noexcept
    : m_data {std::move(rhs.m_data)}
{}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (this != &rhs) {
        m_data = maybe_copy_data(rhs.m_data.get());
    }
    return *this;
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    if (this != &rhs) {
        m_data = std::move(rhs.m_data);
    }
    return *this;
}

auto Status::ok() -> Status
{
    return Status {};
}

auto Status::lexical_error(const Slice &what) -> Status
{
    return Status {Code::LEXICAL_ERROR, what};
}

auto Status::syntax_error(const Slice &what) -> Status
{
    return Status {Code::SYNTAX_ERROR, what};
}

auto Status::unresolved_reference(const Slice &what) -> Status
{
    return Status {Code::UNRESOLVED_REFERENCE, what};
}

auto Status::invalid_identifier(const Slice &what) -> Status
{
    return Status {Code::INVALID_IDENTIFIER, what};
}

auto Status::group_mismatch(const Slice &what) -> Status
{
    return Status {Code::GROUP_MISMATCH, what};
}

auto Status::invalid_argument(const Slice &what) -> Status
{
    return Status {Code::INVALID_ARGUMENT, what};
}

auto Status::system_error(const Slice &what) -> Status
{
    return Status {Code::SYSTEM_ERROR, what};
}

auto Status::not_found(const Slice &what) -> Status
{
    return Status {Code::NOT_FOUND, what};
}

auto Status::has_code(Code code) const -> bool
{
    return !is_ok() && Code {m_data[0]} == code;
}

auto Status::is_ok() const -> bool
{
    return m_data == nullptr;
}

auto Status::is_lexical_error() const -> bool
{
    return has_code(Code::LEXICAL_ERROR);
}

auto Status::is_syntax_error() const -> bool
{
    return has_code(Code::SYNTAX_ERROR);
}

auto Status::is_unresolved_reference() const -> bool
{
    return has_code(Code::UNRESOLVED_REFERENCE);
}

auto Status::is_invalid_identifier() const -> bool
{
    return has_code(Code::INVALID_IDENTIFIER);
}

auto Status::is_group_mismatch() const -> bool
{
    return has_code(Code::GROUP_MISMATCH);
}

auto Status::is_invalid_argument() const -> bool
{
    return has_code(Code::INVALID_ARGUMENT);
}

auto Status::is_system_error() const -> bool
{
    return has_code(Code::SYSTEM_ERROR);
}

auto Status::is_not_found() const -> bool
{
    return has_code(Code::NOT_FOUND);
}

auto Status::what() const -> Slice
{
    return m_data ? Slice {m_data.get() + sizeof(Code)} : Slice {"ok"};
}

} // namespace Mork
