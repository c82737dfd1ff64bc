#pragma once

#include "fileio.h"
#include "file.write.stage.hh"
#include "io.system.hh"
#include "push.source.hh"

#include <cstddef> // size_t
#include <memory>
#include <optional>

struct FileIOSystem_s
{
  public:
    explicit FileIOSystem_s(const char* config_json);

    fileio::IOSystem& system() noexcept;

  private:
    fileio::IOSystem system_;
};

struct FileIOSink_s
{
  public:
    FileIOSink_s(FileIOSystem_s* system, const FileIOSinkSettings* settings);
    ~FileIOSink_s();

    /**
     * @brief Hand a chunk to the stage, blocking until it asks for one.
     * @return False if the run has already terminated.
     */
    [[nodiscard]] bool write(const void* data, size_t nbytes);

    /** @brief Complete the stream and wait for the result. */
    fileio::IOResult finish();

    /** @brief Cancel the run and wait for the result. */
    fileio::IOResult cancel();

    [[nodiscard]] bool is_done() const;

  private:
    std::shared_ptr<fileio::PushSource> source_;
    std::shared_ptr<fileio::FileWriteStage> stage_;

    /** @brief Copy settings into an OpenSpec. */
    static fileio::OpenSpec make_spec_(const FileIOSinkSettings* settings);
};

FileIOStatusCode
to_status_code(fileio::IOStatus status);
