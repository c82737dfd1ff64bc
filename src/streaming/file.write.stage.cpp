#include "file.write.stage.hh"
#include "macros.hh"

fileio::FileWriteStage::FileWriteStage(OpenSpec spec,
                                       std::shared_ptr<ThreadPool> io_context,
                                       SinkFactory make_sink)
  : spec_{ std::move(spec) }
  , io_context_{ std::move(io_context) }
  , make_sink_{ std::move(make_sink) }
  , state_{ State::Uninitialized }
  , demand_outstanding_{ false }
  , io_in_flight_{ false }
  , bytes_written_{ 0 }
{
    std::string err;
    EXPECT(validate_open_spec(spec_, err), "Invalid open spec: ", err);
    EXPECT(io_context_, "No execution context for '", spec_.path, "'");
    EXPECT(make_sink_, "No sink factory for '", spec_.path, "'");

    future_ = promise_.get_future().share();
}

void
fileio::FileWriteStage::on_subscribe(std::shared_ptr<Upstream> upstream)
{
    EXPECT(upstream, "Null pointer: upstream");

    {
        std::unique_lock lock(mutex_);
        if (state_ != State::Uninitialized) {
            lock.unlock();
            LOG_WARNING("Stage for '",
                        spec_.path,
                        "' cannot be subscribed twice. Cancelling upstream.");
            upstream->cancel();
            return;
        }

        upstream_ = std::move(upstream);
        state_ = State::Opening;
        io_in_flight_ = true;
    }

    if (!dispatch_([this] { open_(); })) {
        abort_(IOStatus::Cancelled,
               "Dispatcher '" + io_context_->name() + "' rejected the open job");
    }
}

void
fileio::FileWriteStage::on_push(Chunk&& chunk)
{
    {
        std::unique_lock lock(mutex_);
        // chunks racing a termination that was already signalled upstream
        if (termination_ || state_ == State::Closing ||
            state_ == State::Completed) {
            LOG_DEBUG("Dropping chunk of ",
                      chunk.size(),
                      " bytes for '",
                      spec_.path,
                      "' in state ",
                      to_string(state_));
            return;
        }

        // nothing is requested before the sink is open
        if (state_ != State::Writing || !demand_outstanding_) {
            const State state = state_;
            lock.unlock();
            terminate_(IOStatus::Cancelled,
                       std::string("Upstream pushed a chunk without demand "
                                   "in state ") +
                         to_string(state),
                       true);
            return;
        }

        demand_outstanding_ = false;
        io_in_flight_ = true;
    }

    if (!dispatch_([this, chunk = std::move(chunk)]() mutable {
            write_(std::move(chunk));
        })) {
        abort_(IOStatus::Cancelled,
               "Dispatcher '" + io_context_->name() +
                 "' rejected the write job");
    }
}

void
fileio::FileWriteStage::on_complete()
{
    terminate_(IOStatus::Success, {}, false);
}

void
fileio::FileWriteStage::on_error(const std::string& reason)
{
    terminate_(IOStatus::Cancelled, "Upstream failed: " + reason, false);
}

void
fileio::FileWriteStage::cancel()
{
    terminate_(IOStatus::Cancelled,
               "Stream was cancelled before upstream completion",
               true);
}

std::shared_future<fileio::IOResult>
fileio::FileWriteStage::result() const
{
    return future_;
}

void
fileio::FileWriteStage::on_result(ResultCallback&& callback)
{
    std::unique_lock lock(mutex_);
    if (result_) {
        const IOResult result = *result_;
        lock.unlock();
        callback(result);
        return;
    }

    callbacks_.push_back(std::move(callback));
}

fileio::FileWriteStage::State
fileio::FileWriteStage::state() const
{
    std::scoped_lock lock(mutex_);
    return state_;
}

uint64_t
fileio::FileWriteStage::bytes_written() const
{
    std::scoped_lock lock(mutex_);
    return bytes_written_;
}

const fileio::OpenSpec&
fileio::FileWriteStage::spec() const noexcept
{
    return spec_;
}

const fileio::ThreadPool&
fileio::FileWriteStage::io_context() const noexcept
{
    return *io_context_;
}

void
fileio::FileWriteStage::open_()
{
    std::unique_ptr<Sink> sink;
    std::string err;
    try {
        sink = make_sink_(spec_);
        if (!sink) {
            err = "No sink was created for '" + spec_.path + "'";
        }
    } catch (const std::exception& exc) {
        err = exc.what();
    }

    std::unique_lock lock(mutex_);
    io_in_flight_ = false;

    if (!sink) {
        state_ = State::Completed;
        auto upstream = std::move(upstream_);
        lock.unlock();

        if (upstream) {
            upstream->cancel();
        }
        complete_(IOResult::failure(0, IOStatus::OpenFailure, err));
        return;
    }

    sink_ = std::move(sink);

    // a terminal signal arrived while we were opening
    if (termination_) {
        state_ = State::Closing;
        io_in_flight_ = true;
        lock.unlock();

        close_();
        return;
    }

    state_ = State::Writing;
    demand_outstanding_ = true;
    auto upstream = upstream_;
    lock.unlock();

    upstream->request();
}

void
fileio::FileWriteStage::write_(Chunk&& chunk)
{
    const bool success = sink_->write(chunk);

    std::unique_lock lock(mutex_);
    io_in_flight_ = false;
    bytes_written_ = sink_->bytes_written();

    std::shared_ptr<Upstream> upstream;
    if (!success) {
        // an I/O error outranks any pending completion or cancellation
        termination_ = Termination{ IOStatus::WriteFailure, sink_->error() };
        upstream = upstream_;
    }

    if (termination_) {
        state_ = State::Closing;
        io_in_flight_ = true;
        lock.unlock();

        if (upstream) {
            upstream->cancel();
        }
        close_();
        return;
    }

    demand_outstanding_ = true;
    upstream = upstream_;
    lock.unlock();

    upstream->request();
}

void
fileio::FileWriteStage::close_()
{
    const bool closed = sink_->close();

    std::unique_lock lock(mutex_);
    io_in_flight_ = false;
    bytes_written_ = sink_->bytes_written();

    Termination termination =
      termination_.value_or(Termination{ IOStatus::Success, {} });
    if (!closed && termination.status == IOStatus::Success) {
        termination = Termination{ IOStatus::WriteFailure, sink_->error() };
    }

    sink_.reset();
    state_ = State::Completed;
    auto upstream = std::move(upstream_);
    const uint64_t count = bytes_written_;
    lock.unlock();

    upstream.reset();
    if (termination.status == IOStatus::Success) {
        complete_(IOResult::success(count));
    } else {
        complete_(IOResult::failure(
          count, termination.status, std::move(termination.cause)));
    }
}

void
fileio::FileWriteStage::terminate_(IOStatus status,
                                   std::string cause,
                                   bool cancel_upstream)
{
    std::unique_lock lock(mutex_);
    if (state_ == State::Closing || state_ == State::Completed ||
        termination_) {
        LOG_DEBUG("Ignoring terminal signal ",
                  to_string(status),
                  " for '",
                  spec_.path,
                  "' in state ",
                  to_string(state_));
        return;
    }

    termination_ = Termination{ status, cause };

    std::shared_ptr<Upstream> upstream;
    if (cancel_upstream) {
        upstream = upstream_;
    }

    if (state_ == State::Uninitialized) {
        // never subscribed, so there is no sink to close
        state_ = State::Completed;
        lock.unlock();

        if (status == IOStatus::Success) {
            complete_(IOResult::success(0));
        } else {
            complete_(IOResult::failure(0, status, std::move(cause)));
        }
        return;
    }

    // an in-flight open or write picks up the termination when it finishes
    const bool close_now = state_ == State::Writing && !io_in_flight_;
    if (close_now) {
        state_ = State::Closing;
        io_in_flight_ = true;
    }
    lock.unlock();

    if (upstream) {
        upstream->cancel();
    }

    if (close_now && !dispatch_([this] { close_(); })) {
        abort_(status,
               "Dispatcher '" + io_context_->name() +
                 "' rejected the close job");
    }
}

void
fileio::FileWriteStage::abort_(IOStatus status, const std::string& cause)
{
    std::unique_lock lock(mutex_);
    if (state_ == State::Completed) {
        return;
    }

    state_ = State::Completed;
    io_in_flight_ = false;
    auto sink = std::move(sink_);
    auto upstream = std::move(upstream_);
    lock.unlock();

    LOG_ERROR("Aborting write run to '", spec_.path, "': ", cause);

    if (upstream) {
        upstream->cancel();
    }

    uint64_t count = 0;
    if (sink) {
        count = sink->bytes_written();
        if (!finalize_sink(std::move(sink))) {
            LOG_ERROR("Failed to close '", spec_.path, "' while aborting");
        }
    }

    if (status == IOStatus::Success) {
        status = IOStatus::Cancelled;
    }
    complete_(IOResult::failure(count, status, cause));
}

bool
fileio::FileWriteStage::dispatch_(std::function<void()>&& job)
{
    auto self = shared_from_this();
    return io_context_->push_job(
      [self, job = std::move(job)](std::string& err) -> bool {
          try {
              job();
          } catch (const std::exception& exc) {
              err = "Write run to '" + self->spec_.path + "' failed: " + exc.what();
              self->abort_(IOStatus::WriteFailure, err);
              return false;
          }
          return true;
      });
}

void
fileio::FileWriteStage::complete_(IOResult&& result)
{
    std::vector<ResultCallback> callbacks;
    {
        std::scoped_lock lock(mutex_);
        if (result_) {
            LOG_ERROR("Write run to '",
                      spec_.path,
                      "' already completed with ",
                      *result_,
                      ". Dropping ",
                      result);
            return;
        }

        result_ = result;
        callbacks.swap(callbacks_);
    }

    if (result.was_successful()) {
        LOG_DEBUG("Wrote ", result.count, " bytes to '", spec_.path, "'");
    } else {
        LOG_WARNING("Write run to '", spec_.path, "' finished with ", result);
    }

    promise_.set_value(result);
    for (auto& callback : callbacks) {
        callback(result);
    }
}

const char*
fileio::to_string(FileWriteStage::State state)
{
    switch (state) {
        case FileWriteStage::State::Uninitialized:
            return "Uninitialized";
        case FileWriteStage::State::Opening:
            return "Opening";
        case FileWriteStage::State::Writing:
            return "Writing";
        case FileWriteStage::State::Closing:
            return "Closing";
        case FileWriteStage::State::Completed:
            return "Completed";
        default:
            return "(unknown)";
    }
}
