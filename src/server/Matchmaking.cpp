//
// Matchmaking.cpp
//

#include "Matchmaking.hpp"

#include <algorithm>
#include <exception>
#include <print>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"

namespace caroquest::server
{
    MatchmakingProcessor::MatchmakingProcessor(asio::io_context& io, SessionStore& store, MatchmakingConfig cfg)
        : store_(store),
          cfg_(cfg),
          running_(std::make_shared<std::atomic<bool>>(false)),
          timer_(io)
    {
    }

    MatchmakingProcessor::~MatchmakingProcessor()
    {
        Stop();
    }

    auto MatchmakingProcessor::Start() -> void
    {
        if (running_->exchange(true)) return;
        std::print("[Matchmaking] Started, tick every {} ms\n", cfg_.tick_interval.count());
        Arm();
    }

    auto MatchmakingProcessor::Stop() -> void
    {
        if (!running_->exchange(false)) return;
        timer_.cancel();
        std::print("[Matchmaking] Stopped\n");
    }

    auto MatchmakingProcessor::Arm() -> void
    {
        timer_.expires_after(cfg_.tick_interval);
        timer_.async_wait([this, running = running_](asio::error_code const& ec)
        {
            if (ec == asio::error::operation_aborted || !running->load()) return;
            Tick();
            if (running->load()) Arm();
        });
    }

    auto MatchmakingProcessor::Enqueue(MatchmakingEntry entry) -> std::expected<std::size_t, StoreError>
    {
        std::scoped_lock lock(mtx_);
        if (std::ranges::contains(queue_, entry.handle, &MatchmakingEntry::handle))
        {
            return std::unexpected(StoreError{StoreErrorKind::Rejected, "You are already in the matchmaking queue."});
        }

        if (entry.enqueued_at == Clock::time_point{}) entry.enqueued_at = Clock::now();
        std::print("[Matchmaking] \"{}\" queued (rating {})\n", entry.name, entry.rating);
        queue_.push_back(std::move(entry));
        return queue_.size();
    }

    auto MatchmakingProcessor::Dequeue(ConnectionId const& handle) -> bool
    {
        std::scoped_lock lock(mtx_);
        auto const it = std::ranges::find(queue_, handle, &MatchmakingEntry::handle);
        if (it == queue_.end()) return false;

        std::print("[Matchmaking] \"{}\" left the queue\n", it->name);
        queue_.erase(it);
        return true;
    }

    auto MatchmakingProcessor::Tick() -> std::size_t
    {
        using Notice = std::pair<std::function<void(MatchNotification const&)>, MatchNotification>;
        std::vector<Notice> notices;
        std::size_t pairs = 0;

        {
            std::scoped_lock lock(mtx_);
            std::ranges::stable_sort(queue_, {}, &MatchmakingEntry::enqueued_at);

            auto const requeue = [this](MatchmakingEntry&& first, MatchmakingEntry&& second)
            {
                queue_.push_front(std::move(second));
                queue_.push_front(std::move(first));
            };

            while (queue_.size() >= 2)
            {
                MatchmakingEntry first = std::move(queue_.front());
                queue_.pop_front();
                MatchmakingEntry second = std::move(queue_.front());
                queue_.pop_front();

                GameOptions const opts{
                    .pawns_per_player = cfg_.pawns_per_player,
                    .is_public = false,
                    .is_matchmaking = true,
                    .is_ranked = true,
                };

                try
                {
                    auto created = store_.CreateGame(first.handle, first.name, opts);
                    if (!created)
                    {
                        std::print("[Matchmaking] Create failed for \"{}\": {}\n", first.name, created.error().message);
                        requeue(std::move(first), std::move(second));
                        break;
                    }

                    auto joined = store_.AddPlayerToGame(*created, second.handle, second.name);
                    if (!joined)
                    {
                        std::print("[Matchmaking] Join failed for \"{}\" in {}: {}\n",
                                   second.name, *created, joined.error().message);
                        store_.DeleteGame(*created);
                        requeue(std::move(first), std::move(second));
                        break;
                    }

                    auto const ts = NowMs();
                    notices.emplace_back(first.notify, MatchNotification{*created, 1, second.name, ts});
                    notices.emplace_back(second.notify, MatchNotification{*created, joined->player_id, first.name, ts});
                    ++pairs;
                    std::print("[Matchmaking] Paired \"{}\" vs \"{}\" in {}\n", first.name, second.name, *created);
                }
                catch (core::OmegaException<core::error::Code> const& e)
                {
                    std::print("[Matchmaking] Pairing raised: {}\n", e);
                    requeue(std::move(first), std::move(second));
                    break;
                }
                catch (std::exception const& e)
                {
                    std::print("[Matchmaking] Pairing raised: {}\n", e.what());
                    requeue(std::move(first), std::move(second));
                    break;
                }
            }
        }

        // outside the lock; a callback may re-enter Enqueue
        for (auto const& [notify, note] : notices)
        {
            if (notify) notify(note);
        }
        return pairs;
    }

    auto MatchmakingProcessor::QueueSize() const -> std::size_t
    {
        std::scoped_lock lock(mtx_);
        return queue_.size();
    }

    auto MatchmakingProcessor::IsQueued(ConnectionId const& handle) const -> bool
    {
        std::scoped_lock lock(mtx_);
        return std::ranges::contains(queue_, handle, &MatchmakingEntry::handle);
    }
}
