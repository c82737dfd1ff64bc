#include "fileio.sink.hh"
#include "macros.hh"

#include <cstring> // memcpy

namespace {
[[nodiscard]]
bool
validate_settings(const FileIOSinkSettings* settings)
{
    if (!settings) {
        LOG_ERROR("Null pointer: settings");
        return false;
    }

    if (settings->path == nullptr) {
        LOG_ERROR("Null pointer: path");
        return false;
    }

    if (std::string_view(settings->path).empty()) {
        LOG_ERROR("Path is empty");
        return false;
    }

    if (settings->open_flags & ~FileIOOpenFlagMask) {
        LOG_ERROR("Invalid open flags: ", settings->open_flags);
        return false;
    }

    if (settings->dispatcher != nullptr &&
        std::string_view(settings->dispatcher).empty()) {
        LOG_ERROR("Dispatcher name is empty");
        return false;
    }

    return true;
}
} // namespace

FileIOSystem_s::FileIOSystem_s(const char* config_json)
  : system_(fileio::IOSystemSettings::from_json(config_json ? config_json
                                                            : ""))
{
}

fileio::IOSystem&
FileIOSystem_s::system() noexcept
{
    return system_;
}

FileIOSink_s::FileIOSink_s(FileIOSystem_s* system,
                           const FileIOSinkSettings* settings)
{
    EXPECT(system, "Null pointer: system");
    if (!validate_settings(settings)) {
        throw std::runtime_error("Invalid file sink settings");
    }

    fileio::StageAttributes attributes;
    if (settings->dispatcher) {
        attributes.dispatcher = settings->dispatcher;
    }

    stage_ = system->system().to_path(make_spec_(settings), attributes);
    source_ = std::make_shared<fileio::PushSource>();

    // the stage starts opening the file as soon as it is subscribed
    source_->subscribe(stage_);
}

FileIOSink_s::~FileIOSink_s()
{
    if (!stage_ || is_done()) {
        return;
    }

    try {
        const auto result = cancel();
        LOG_DEBUG("Sink destroyed before it finished: ", result);
    } catch (const std::exception& e) {
        LOG_ERROR("Error finalizing file sink: ", e.what());
    }
}

bool
FileIOSink_s::write(const void* data, size_t nbytes)
{
    fileio::Chunk chunk(nbytes);
    if (nbytes > 0) {
        std::memcpy(chunk.data(), data, nbytes);
    }

    return source_->offer(std::move(chunk));
}

fileio::IOResult
FileIOSink_s::finish()
{
    source_->complete();
    return stage_->result().get();
}

fileio::IOResult
FileIOSink_s::cancel()
{
    stage_->cancel();
    return stage_->result().get();
}

bool
FileIOSink_s::is_done() const
{
    return stage_->state() == fileio::FileWriteStage::State::Completed;
}

fileio::OpenSpec
FileIOSink_s::make_spec_(const FileIOSinkSettings* settings)
{
    fileio::OpenSpec spec{
        .path = settings->path,
        .flags = settings->open_flags,
    };

    if (settings->start_position > 0) {
        spec.start_position = settings->start_position;
    }

    return spec;
}

FileIOStatusCode
to_status_code(fileio::IOStatus status)
{
    switch (status) {
        case fileio::IOStatus::Success:
            return FileIOStatusCode_Success;
        case fileio::IOStatus::OpenFailure:
            return FileIOStatusCode_OpenFailure;
        case fileio::IOStatus::WriteFailure:
            return FileIOStatusCode_WriteFailure;
        case fileio::IOStatus::Cancelled:
            return FileIOStatusCode_Cancelled;
    }

    return FileIOStatusCode_InternalError;
}
