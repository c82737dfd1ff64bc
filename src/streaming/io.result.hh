#pragma once

#include <cstdint> // uint64_t
#include <ostream>
#include <string>

namespace fileio {
enum class IOStatus
{
    Success,
    OpenFailure,  // path, create, or permission problem; nothing was written
    WriteFailure, // I/O error while writing or closing
    Cancelled,    // run terminated early by upstream or downstream
};

const char*
to_string(IOStatus status);

std::ostream&
operator<<(std::ostream& os, IOStatus status);

/**
 * @brief The materialized outcome of one write run.
 * @details @p count is the number of bytes the OS accepted, also when the run
 * failed.
 */
struct IOResult
{
    uint64_t count{ 0 };
    IOStatus status{ IOStatus::Success };
    std::string error;

    [[nodiscard]] bool was_successful() const noexcept;

    static IOResult success(uint64_t count);
    static IOResult failure(uint64_t count, IOStatus status, std::string error);
};

std::ostream&
operator<<(std::ostream& os, const IOResult& result);
} // namespace fileio
