#include "io.result.hh"
#include "macros.hh"

const char*
fileio::to_string(IOStatus status)
{
    switch (status) {
        case IOStatus::Success:
            return "Success";
        case IOStatus::OpenFailure:
            return "OpenFailure";
        case IOStatus::WriteFailure:
            return "WriteFailure";
        case IOStatus::Cancelled:
            return "Cancelled";
        default:
            return "(unknown)";
    }
}

std::ostream&
fileio::operator<<(std::ostream& os, IOStatus status)
{
    return os << to_string(status);
}

bool
fileio::IOResult::was_successful() const noexcept
{
    return status == IOStatus::Success;
}

fileio::IOResult
fileio::IOResult::success(uint64_t count)
{
    return { .count = count, .status = IOStatus::Success, .error = {} };
}

fileio::IOResult
fileio::IOResult::failure(uint64_t count, IOStatus status, std::string error)
{
    EXPECT(status != IOStatus::Success, "A failed result needs a failure status");

    return { .count = count, .status = status, .error = std::move(error) };
}

std::ostream&
fileio::operator<<(std::ostream& os, const IOResult& result)
{
    os << "IOResult(" << result.count << ", " << result.status;
    if (!result.error.empty()) {
        os << ": " << result.error;
    }
    return os << ")";
}
