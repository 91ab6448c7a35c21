/**
 * @file playback_queue.h
 * @brief LoanVoice - Ordered playback of synthesized speech
 *
 * Items are base64 RIFF/WAVE payloads, played strictly in arrival order, one
 * at a time, on a single output context that is opened on the first
 * playable item and kept until release_output().
 *
 * The next item is started from a task posted by the previous item's
 * completion, never from the completion's own call stack. flush() halts the
 * active item and discards the queue; the halted item's completion is
 * recognised by generation and only used to resume items enqueued after the
 * flush that found the output still halting.
 */

#ifndef LOANVOICE_PLAYBACK_PLAYBACK_QUEUE_H
#define LOANVOICE_PLAYBACK_PLAYBACK_QUEUE_H

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "loanvoice/audio/audio_output.h"
#include "loanvoice/core/error.h"
#include "loanvoice/core/generation.h"

namespace loanvoice {

class EventLoop;

struct PlaybackItem {
    uint64_t id = 0;
    std::string payload;  ///< base64 audio
};

struct PlaybackStats {
    uint64_t enqueued = 0;
    uint64_t played = 0;
    uint64_t skipped = 0;  ///< Decode or output failures
    uint64_t flushed = 0;  ///< Dropped by flush(), including a halted item
};

class PlaybackQueue {
public:
    // Loop thread: nothing left to play (queue drained or every item skipped)
    using IdleCallback = std::function<void()>;
    // Loop thread: an item was handed to the output
    using ItemStartedCallback = std::function<void(const PlaybackItem& item)>;

    PlaybackQueue(EventLoop& loop, AudioOutputFactory output_factory);
    ~PlaybackQueue();

    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    void set_idle_callback(IdleCallback callback) { on_idle_ = std::move(callback); }
    void set_item_started_callback(ItemStartedCallback callback) {
        on_item_started_ = std::move(callback);
    }

    // Append; draining starts on the next loop iteration if idle. Returns the item id.
    uint64_t enqueue(std::string payload);

    // Halt the active item and drop everything queued
    void flush();

    // Flush and close the output context
    void release_output();

    size_t size() const { return queue_.size(); }
    bool is_playing() const { return playing_; }
    bool has_output() const { return output_ != nullptr; }

    const PlaybackStats& stats() const { return stats_; }
    const Error& last_error() const { return last_error_; }

private:
    void schedule_drain();
    void drain();
    void on_item_finished(bool completed);
    void on_output_released();
    bool ensure_output();

    EventLoop& loop_;
    AudioOutputFactory output_factory_;
    std::unique_ptr<AudioOutput> output_;

    std::deque<PlaybackItem> queue_;
    bool playing_ = false;
    bool draining_ = false;
    bool drain_scheduled_ = false;
    bool waiting_for_output_ = false;
    uint64_t next_id_ = 1;
    std::shared_ptr<Generation> generation_ = std::make_shared<Generation>();

    IdleCallback on_idle_;
    ItemStartedCallback on_item_started_;
    PlaybackStats stats_;
    Error last_error_;
};

}  // namespace loanvoice

#endif  // LOANVOICE_PLAYBACK_PLAYBACK_QUEUE_H
