#include "iterable.source.hh"
#include "macros.hh"

fileio::IterableSource::IterableSource(Generator&& next,
                                       std::shared_ptr<ThreadPool> dispatcher)
  : next_{ std::move(next) }
  , dispatcher_{ std::move(dispatcher) }
  , demand_{ 0 }
  , emitted_{ 0 }
  , cancelled_{ false }
  , finished_{ false }
{
    EXPECT(next_, "Null generator");
    EXPECT(dispatcher_, "Null pointer: dispatcher");
}

std::shared_ptr<fileio::IterableSource>
fileio::IterableSource::from_chunks(std::vector<Chunk> chunks,
                                    std::shared_ptr<ThreadPool> dispatcher)
{
    auto remaining = std::make_shared<std::vector<Chunk>>(std::move(chunks));
    size_t index = 0;

    return std::make_shared<IterableSource>(
      [remaining, index]() mutable -> std::optional<Chunk> {
          if (index == remaining->size()) {
              return std::nullopt;
          }
          return std::move((*remaining)[index++]);
      },
      std::move(dispatcher));
}

void
fileio::IterableSource::subscribe(std::shared_ptr<Subscriber> subscriber)
{
    EXPECT(subscriber, "Null pointer: subscriber");

    {
        std::scoped_lock lock(mutex_);
        EXPECT(!subscriber_ && !finished_ && !cancelled_,
               "Source has already been subscribed");
        subscriber_ = subscriber;
    }

    subscriber->on_subscribe(shared_from_this());
}

void
fileio::IterableSource::request()
{
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_ || finished_ || !subscriber_) {
            return;
        }
        ++demand_;
    }

    auto self = shared_from_this();
    if (!dispatcher_->push_job(
          [self](std::string& err) { return self->emit_(err); })) {
        finish_("Dispatcher '" + dispatcher_->name() +
                "' is not accepting jobs");
    }
}

void
fileio::IterableSource::cancel()
{
    std::scoped_lock lock(mutex_);
    if (!cancelled_ && !finished_) {
        LOG_DEBUG("Source cancelled after ", emitted_, " chunks");
    }
    cancelled_ = true;
    subscriber_.reset();
}

size_t
fileio::IterableSource::chunks_emitted() const
{
    std::scoped_lock lock(mutex_);
    return emitted_;
}

bool
fileio::IterableSource::is_cancelled() const
{
    std::scoped_lock lock(mutex_);
    return cancelled_;
}

bool
fileio::IterableSource::emit_(std::string& err)
{
    std::scoped_lock emit_lock(emit_mutex_);

    std::shared_ptr<Subscriber> subscriber;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_ || finished_ || demand_ == 0) {
            return true;
        }
        --demand_;
        subscriber = subscriber_;
    }

    std::optional<Chunk> chunk;
    try {
        chunk = next_();
    } catch (const std::exception& exc) {
        err = std::string("Source generator failed: ") + exc.what();
        finish_(err);
        return false;
    }

    if (!chunk) {
        finish_(std::nullopt);
        return true;
    }

    {
        std::scoped_lock lock(mutex_);
        if (cancelled_) {
            return true;
        }
        ++emitted_;
    }

    subscriber->on_push(std::move(*chunk));
    return true;
}

void
fileio::IterableSource::finish_(const std::optional<std::string>& error)
{
    std::shared_ptr<Subscriber> subscriber;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_ || finished_) {
            return;
        }
        finished_ = true;
        subscriber = std::move(subscriber_);
    }

    if (!subscriber) {
        return;
    }

    if (error) {
        subscriber->on_error(*error);
    } else {
        subscriber->on_complete();
    }
}
