#include "sink.hh"
#include "macros.hh"

uint64_t
fileio::Sink::bytes_written() const noexcept
{
    return bytes_written_;
}

const std::string&
fileio::Sink::error() const noexcept
{
    return error_;
}

void
fileio::Sink::set_error_(const std::string& msg)
{
    error_ = msg;
    LOG_ERROR(msg);
}

bool
fileio::finalize_sink(std::unique_ptr<fileio::Sink>&& sink)
{
    if (sink == nullptr) {
        LOG_INFO("Sink is null. Nothing to finalize.");
        return true;
    }

    if (!sink->close()) {
        return false;
    }

    sink.reset();
    return true;
}
