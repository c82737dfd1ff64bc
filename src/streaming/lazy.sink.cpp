#include "lazy.sink.hh"
#include "macros.hh"

class fileio::LazySink::Relay final : public Upstream
{
  public:
    explicit Relay(std::weak_ptr<LazySink> sink)
      : sink_{ std::move(sink) }
    {
    }

    void request() override
    {
        if (auto sink = sink_.lock()) {
            sink->relay_request_();
        }
    }

    void cancel() override
    {
        if (auto sink = sink_.lock()) {
            sink->relay_cancel_();
        }
    }

  private:
    std::weak_ptr<LazySink> sink_;
};

fileio::LazySink::LazySink(StageFactory&& make_stage, IOResult fallback)
  : make_stage_{ std::move(make_stage) }
  , fallback_{ std::move(fallback) }
  , upstream_finished_{ false }
  , end_delivered_{ false }
  , completed_{ false }
{
    EXPECT(make_stage_, "Null stage factory");

    future_ = promise_.get_future().share();
}

void
fileio::LazySink::on_subscribe(std::shared_ptr<Upstream> upstream)
{
    EXPECT(upstream, "Null pointer: upstream");

    {
        std::unique_lock lock(mutex_);
        if (upstream_ || completed_) {
            lock.unlock();
            LOG_WARNING("Lazy sink cannot be subscribed twice. Cancelling "
                        "upstream.");
            upstream->cancel();
            return;
        }
        upstream_ = upstream;
    }

    upstream->request();
}

void
fileio::LazySink::on_push(Chunk&& chunk)
{
    {
        std::unique_lock lock(mutex_);
        if (completed_) {
            LOG_DEBUG("Dropping chunk of ", chunk.size(), " bytes");
            return;
        }

        if (auto stage = stage_) {
            lock.unlock();
            stage->on_push(std::move(chunk));
            return;
        }

        if (held_) {
            auto upstream = upstream_;
            lock.unlock();

            if (upstream) {
                upstream->cancel();
            }
            complete_(IOResult::failure(0,
                                        IOStatus::Cancelled,
                                        "Upstream pushed a chunk without demand "
                                        "before the sink was created"));
            return;
        }

        held_ = std::move(chunk);
    }

    std::shared_ptr<FileWriteStage> stage;
    std::string err = "No stage was created";
    try {
        stage = make_stage_();
    } catch (const std::exception& exc) {
        err = exc.what();
    }

    if (!stage) {
        std::shared_ptr<Upstream> upstream;
        {
            std::scoped_lock lock(mutex_);
            upstream = upstream_;
        }
        if (upstream) {
            upstream->cancel();
        }
        complete_(IOResult::failure(
          0, IOStatus::OpenFailure, "Failed to create the sink: " + err));
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        if (completed_) {
            LOG_DEBUG("Sink was cancelled while it was being created");
            return;
        }
        stage_ = stage;
    }

    auto self = shared_from_this();
    stage->on_result([self](const IOResult& result) { self->complete_(result); });
    stage->on_subscribe(std::make_shared<Relay>(weak_from_this()));
}

void
fileio::LazySink::on_complete()
{
    finish_upstream_(std::nullopt);
}

void
fileio::LazySink::on_error(const std::string& reason)
{
    finish_upstream_(reason);
}

void
fileio::LazySink::cancel()
{
    std::unique_lock lock(mutex_);
    if (completed_) {
        return;
    }

    if (auto stage = stage_) {
        lock.unlock();
        stage->cancel();
        return;
    }

    auto upstream = upstream_;
    lock.unlock();

    if (upstream) {
        upstream->cancel();
    }
    complete_(IOResult::failure(
      0, IOStatus::Cancelled, "Stream was cancelled before the sink was created"));
}

std::shared_future<fileio::IOResult>
fileio::LazySink::result() const
{
    return future_;
}

std::shared_ptr<fileio::FileWriteStage>
fileio::LazySink::stage() const
{
    std::scoped_lock lock(mutex_);
    return stage_;
}

void
fileio::LazySink::relay_request_()
{
    std::unique_lock lock(mutex_);
    auto stage = stage_;

    if (held_) {
        Chunk chunk = std::move(*held_);
        held_.reset();
        lock.unlock();

        stage->on_push(std::move(chunk));
        return;
    }

    if (upstream_finished_) {
        if (end_delivered_) {
            return;
        }
        end_delivered_ = true;
        const auto failure = upstream_failure_;
        lock.unlock();

        if (failure) {
            stage->on_error(*failure);
        } else {
            stage->on_complete();
        }
        return;
    }

    auto upstream = upstream_;
    lock.unlock();

    if (upstream) {
        upstream->request();
    }
}

void
fileio::LazySink::relay_cancel_()
{
    std::shared_ptr<Upstream> upstream;
    {
        std::scoped_lock lock(mutex_);
        held_.reset();
        upstream = upstream_;
    }

    if (upstream) {
        upstream->cancel();
    }
}

void
fileio::LazySink::finish_upstream_(std::optional<std::string> failure)
{
    std::unique_lock lock(mutex_);
    if (completed_ || upstream_finished_) {
        return;
    }

    upstream_finished_ = true;
    upstream_failure_ = failure;

    // upstream ended without emitting anything
    if (!stage_ && !held_) {
        lock.unlock();
        if (failure) {
            complete_(IOResult::failure(
              0, IOStatus::Cancelled, "Upstream failed: " + *failure));
        } else {
            complete_(fallback_);
        }
        return;
    }

    // delivered once the held chunk has been handed over
    if (held_ || !stage_) {
        return;
    }

    end_delivered_ = true;
    auto stage = stage_;
    lock.unlock();

    if (failure) {
        stage->on_error(*failure);
    } else {
        stage->on_complete();
    }
}

void
fileio::LazySink::complete_(const IOResult& result)
{
    {
        std::scoped_lock lock(mutex_);
        if (completed_) {
            return;
        }
        completed_ = true;
        held_.reset();
        upstream_.reset();
    }

    promise_.set_value(result);
}
