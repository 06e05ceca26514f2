#ifndef MORK_STATUS_H
#define MORK_STATUS_H

#include <memory>
#include "slice.h"

namespace Mork {

class Status final {
public:
    /*
     * Create an OK status.
     */
    [[nodiscard]] static auto ok() -> Status;

    /*
     * Create a non-OK status with an error message.
     */
    [[nodiscard]] static auto lexical_error(const Slice &what) -> Status;
    [[nodiscard]] static auto syntax_error(const Slice &what) -> Status;
    [[nodiscard]] static auto unresolved_reference(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_identifier(const Slice &what) -> Status;
    [[nodiscard]] static auto group_mismatch(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_argument(const Slice &what) -> Status;
    [[nodiscard]] static auto system_error(const Slice &what) -> Status;
    [[nodiscard]] static auto not_found(const Slice &what) -> Status;

    /*
     * Check status type.
     */
    [[nodiscard]] auto is_ok() const -> bool;
    [[nodiscard]] auto is_lexical_error() const -> bool;
    [[nodiscard]] auto is_syntax_error() const -> bool;
    [[nodiscard]] auto is_unresolved_reference() const -> bool;
    [[nodiscard]] auto is_invalid_identifier() const -> bool;
    [[nodiscard]] auto is_group_mismatch() const -> bool;
    [[nodiscard]] auto is_invalid_argument() const -> bool;
    [[nodiscard]] auto is_system_error() const -> bool;
    [[nodiscard]] auto is_not_found() const -> bool;

    /*
     * Get the error message, if it exists. OK statuses return "ok".
     */
    [[nodiscard]] auto what() const -> Slice;

    Status(const Status &rhs);
    auto operator=(const Status &rhs) -> Status &;
    Status(Status &&rhs) noexcept;
    auto operator=(Status &&rhs) noexcept -> Status &;

private:
    enum class Code : Byte {
        LEXICAL_ERROR = 1,
        SYNTAX_ERROR = 2,
        UNRESOLVED_REFERENCE = 3,
        INVALID_IDENTIFIER = 4,
        GROUP_MISMATCH = 5,
        INVALID_ARGUMENT = 6,
        SYSTEM_ERROR = 7,
        NOT_FOUND = 8,
    };

    // Construct an OK status. No allocation is needed.
    Status() = default;

    // Construct a non-OK status.
    Status(Code code, const Slice &what);

    [[nodiscard]] auto has_code(Code code) const -> bool;

    // Storage for a status code and a message.
    std::unique_ptr<Byte[]> m_data;
};

// Status object should be the size of a pointer.
static_assert(sizeof(Status) == sizeof(void *));

} // namespace Mork

#endif // MORK_STATUS_H
