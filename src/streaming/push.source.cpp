#include "push.source.hh"
#include "macros.hh"

fileio::PushSource::PushSource()
  : demand_{ 0 }
  , subscribed_{ false }
  , cancelled_{ false }
  , finished_{ false }
{
}

void
fileio::PushSource::subscribe(std::shared_ptr<Subscriber> subscriber)
{
    EXPECT(subscriber, "Null pointer: subscriber");

    {
        std::scoped_lock lock(mutex_);
        EXPECT(!subscribed_ && !cancelled_,
               "Source has already been subscribed");
        subscribed_ = true;
    }

    subscriber->on_subscribe(shared_from_this());

    std::optional<std::string> failure;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_) {
            return;
        }

        if (!finished_) {
            subscriber_ = subscriber;
            cv_.notify_all();
            return;
        }
        failure = failure_;
    }

    // the producer finished before the subscriber was attached
    if (failure) {
        subscriber->on_error(*failure);
    } else {
        subscriber->on_complete();
    }
}

bool
fileio::PushSource::offer(Chunk&& chunk)
{
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] {
        return (demand_ > 0 && subscriber_) || cancelled_ || finished_;
    });

    if (cancelled_ || finished_) {
        return false;
    }

    --demand_;
    auto subscriber = subscriber_;
    lock.unlock();

    subscriber->on_push(std::move(chunk));
    return true;
}

void
fileio::PushSource::complete()
{
    finish_(std::nullopt);
}

void
fileio::PushSource::fail(const std::string& reason)
{
    finish_(reason);
}

void
fileio::PushSource::request()
{
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_ || finished_) {
            return;
        }
        ++demand_;
    }
    cv_.notify_all();
}

void
fileio::PushSource::cancel()
{
    {
        std::scoped_lock lock(mutex_);
        cancelled_ = true;
        subscriber_.reset();
    }
    cv_.notify_all();
}

bool
fileio::PushSource::is_cancelled() const
{
    std::scoped_lock lock(mutex_);
    return cancelled_;
}

void
fileio::PushSource::finish_(std::optional<std::string> failure)
{
    std::shared_ptr<Subscriber> subscriber;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_ || finished_) {
            return;
        }
        finished_ = true;
        failure_ = failure;
        subscriber = std::move(subscriber_);
    }
    cv_.notify_all();

    if (!subscriber) {
        return;
    }

    if (failure) {
        subscriber->on_error(*failure);
    } else {
        subscriber->on_complete();
    }
}
