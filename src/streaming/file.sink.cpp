#include "file.sink.hh"
#include "macros.hh"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring> // strerror

namespace {
std::string
errno_message()
{
    return std::strerror(errno);
}
} // namespace

fileio::FileSink::FileSink(const OpenSpec& spec)
  : path_{ spec.path }
  , fd_{ -1 }
  , cursor_{ 0 }
  , append_{ false }
{
    std::string err;
    EXPECT(validate_open_spec(spec, err), "Invalid open spec: ", err);

    const OpenPlan plan = resolve_open_plan(spec);
    append_ = plan.append;

    do {
        fd_ = ::open(path_.c_str(), plan.oflags, 0666);
    } while (fd_ < 0 && errno == EINTR);
    EXPECT(fd_ >= 0,
           "Failed to open '",
           path_,
           "' with flags ",
           open_flags_to_string(spec.flags),
           ": ",
           errno_message());

    if (plan.seek_to.has_value()) {
        const auto offset = static_cast<off_t>(*plan.seek_to);
        if (::lseek(fd_, offset, SEEK_SET) != offset) {
            const std::string msg = errno_message();
            ::close(fd_);
            fd_ = -1;
            EXPECT(false,
                   "Failed to seek to position ",
                   *plan.seek_to,
                   " in '",
                   path_,
                   "': ",
                   msg);
        }
        cursor_ = *plan.seek_to;
    }

    LOG_DEBUG("Opened '", path_, "' at position ", cursor_);
}

fileio::FileSink::~FileSink()
{
    if (is_open() && !close()) {
        LOG_WARNING("Error closing '", path_, "' on destruction: ", error_);
    }
}

bool
fileio::FileSink::write(std::span<const std::byte> data)
{
    if (!is_open()) {
        set_error_("Cannot write to '" + path_ + "': file is not open");
        return false;
    }

    while (!data.empty()) {
        const ssize_t nbytes = ::write(fd_, data.data(), data.size());
        if (nbytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            set_error_("Failed to write " + std::to_string(data.size()) +
                       " bytes to '" + path_ + "': " + errno_message());
            return false;
        }

        if (nbytes == 0) {
            set_error_("Failed to write to '" + path_ + "': no progress");
            return false;
        }

        bytes_written_ += nbytes;
        if (!append_) {
            cursor_ += nbytes;
        }
        data = data.subspan(nbytes);
    }

    return true;
}

bool
fileio::FileSink::close()
{
    if (!is_open()) {
        return true;
    }

    // the descriptor is released even if close(2) reports an error
    const int fd = fd_;
    fd_ = -1;

    if (::close(fd) != 0) {
        set_error_("Failed to close '" + path_ + "': " + errno_message());
        return false;
    }

    LOG_DEBUG("Closed '", path_, "' after ", bytes_written_, " bytes");
    return true;
}

bool
fileio::FileSink::is_open() const noexcept
{
    return fd_ >= 0;
}

uint64_t
fileio::FileSink::cursor() const noexcept
{
    return cursor_;
}

const std::string&
fileio::FileSink::path() const noexcept
{
    return path_;
}

std::unique_ptr<fileio::Sink>
fileio::make_file_sink(const OpenSpec& spec)
{
    return std::make_unique<FileSink>(spec);
}
