// =============================================================================
// Playback Queue - Implementation
// =============================================================================

#include "loanvoice/playback/playback_queue.h"

#include <vector>

#include "loanvoice/audio/wav_codec.h"
#include "loanvoice/core/event_loop.h"
#include "loanvoice/core/logger.h"
#include "loanvoice/protocol/base64.h"

namespace loanvoice {

PlaybackQueue::PlaybackQueue(EventLoop& loop, AudioOutputFactory output_factory)
    : loop_(loop), output_factory_(std::move(output_factory)) {}

PlaybackQueue::~PlaybackQueue() {
    release_output();
}

uint64_t PlaybackQueue::enqueue(std::string payload) {
    PlaybackItem item;
    item.id = next_id_++;
    item.payload = std::move(payload);
    queue_.push_back(std::move(item));
    ++stats_.enqueued;

    LV_LOG_TRACE("Playback", "Enqueued item %llu (depth %zu)",
                 static_cast<unsigned long long>(queue_.back().id), queue_.size());

    if (!playing_) {
        schedule_drain();
    }
    return next_id_ - 1;
}

void PlaybackQueue::schedule_drain() {
    if (drain_scheduled_) {
        return;
    }
    drain_scheduled_ = true;

    // Items enqueued in the same iteration stay queued until this runs
    Generation::Value gen = generation_->current();
    std::weak_ptr<Generation> weak = generation_;
    loop_.post([this, weak, gen]() {
        auto alive = weak.lock();
        if (!alive || !alive->is_current(gen)) return;
        drain_scheduled_ = false;
        drain();
    });
}

bool PlaybackQueue::ensure_output() {
    if (output_) {
        return true;
    }
    std::unique_ptr<AudioOutput> output = output_factory_ ? output_factory_() : nullptr;
    if (!output) {
        last_error_ = make_error(ErrorKind::Device, "No audio output available");
        return false;
    }
    if (!output->open()) {
        last_error_ = output->last_error();
        if (last_error_.ok()) {
            last_error_ = make_error(ErrorKind::Device, "Failed to open audio output");
        }
        return false;
    }
    output_ = std::move(output);
    return true;
}

void PlaybackQueue::drain() {
    // Reentrancy guard: only one drain loop at a time
    if (playing_ || draining_) {
        return;
    }
    draining_ = true;

    // A halted item still holds the output; its completion resumes the drain
    if (!queue_.empty() && output_ && output_->is_busy()) {
        waiting_for_output_ = true;
        draining_ = false;
        LV_LOG_DEBUG("Playback", "Output still halting; %zu item(s) waiting", queue_.size());
        return;
    }

    while (!queue_.empty()) {
        PlaybackItem item = std::move(queue_.front());
        queue_.pop_front();

        std::vector<uint8_t> bytes;
        if (!base64_decode(item.payload, bytes)) {
            ++stats_.skipped;
            last_error_ = make_error(ErrorKind::Decode, "Invalid base64 audio payload");
            LV_LOG_WARNING("Playback", "Skipping item %llu: invalid base64",
                           static_cast<unsigned long long>(item.id));
            continue;
        }

        PcmAudio audio;
        std::string error;
        if (!wav_decode(bytes, audio, error)) {
            ++stats_.skipped;
            last_error_ = make_error(ErrorKind::Decode, error);
            LV_LOG_WARNING("Playback", "Skipping item %llu: %s",
                           static_cast<unsigned long long>(item.id), error.c_str());
            continue;
        }

        if (!ensure_output()) {
            ++stats_.skipped;
            LV_LOG_ERROR("Playback", "Skipping item %llu: %s",
                         static_cast<unsigned long long>(item.id), last_error_.message.c_str());
            continue;
        }

        Generation::Value gen = generation_->current();
        std::weak_ptr<Generation> weak = generation_;
        auto on_complete = [this, weak, gen](bool completed) {
            // Continue from a fresh loop task, not the output's call stack
            loop_.post([this, weak, gen, completed]() {
                auto alive = weak.lock();
                if (!alive) return;
                if (!alive->is_current(gen)) {
                    on_output_released();
                    return;
                }
                on_item_finished(completed);
            });
        };

        playing_ = true;
        if (!output_->play(std::move(audio), on_complete)) {
            playing_ = false;
            ++stats_.skipped;
            last_error_ = output_->last_error();
            LV_LOG_ERROR("Playback", "Output rejected item %llu: %s",
                         static_cast<unsigned long long>(item.id), last_error_.message.c_str());
            continue;
        }

        LV_LOG_DEBUG("Playback", "Playing item %llu (%zu queued)",
                     static_cast<unsigned long long>(item.id), queue_.size());
        if (on_item_started_) {
            on_item_started_(item);
        }
        draining_ = false;
        return;
    }

    draining_ = false;
    if (on_idle_) {
        on_idle_();
    }
}

void PlaybackQueue::on_item_finished(bool completed) {
    playing_ = false;
    if (completed) {
        ++stats_.played;
    } else {
        ++stats_.skipped;
    }
    drain();
}

void PlaybackQueue::on_output_released() {
    if (!waiting_for_output_) {
        return;
    }
    waiting_for_output_ = false;
    drain();
}

void PlaybackQueue::flush() {
    size_t dropped = queue_.size() + (playing_ ? 1 : 0);
    generation_->advance();

    if (playing_ && output_) {
        output_->stop_current();
    }
    playing_ = false;
    drain_scheduled_ = false;
    waiting_for_output_ = false;
    queue_.clear();
    stats_.flushed += dropped;

    if (dropped > 0) {
        LV_LOG_INFO("Playback", "Flushed %zu item(s)", dropped);
    }
}

void PlaybackQueue::release_output() {
    flush();
    if (output_) {
        output_->close();
        output_.reset();
    }
}

}  // namespace loanvoice
