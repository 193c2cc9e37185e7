// dsp/triple_buffer.h - Single-writer / single-reader parameter snapshot
//
// The control thread fills write_buffer() and calls publish(). The audio
// thread calls update() once per block and then reads read_buffer(). Neither
// side ever waits: three slots rotate through an atomic "middle" index, and
// the fresh bit tells the reader a newer snapshot is waiting.
//
// Only one thread may write and only one thread may read. Callers with
// several control threads serialise publish() themselves.
#pragma once

#include <atomic>

namespace hldsp {

template <typename T>
class TripleBuffer {
public:
    explicit TripleBuffer(const T& init = T())
        : slots_{ init, init, init }
    {
    }

    TripleBuffer(const TripleBuffer&) = delete;
    TripleBuffer& operator=(const TripleBuffer&) = delete;

    // ── Writer side ────────────────────────────────────────────────────────
    T& write_buffer() { return slots_[back_]; }

    void publish()
    {
        const int prev = middle_.exchange(back_ | kFresh, std::memory_order_acq_rel);
        back_ = prev & kIndexMask;
    }

    // ── Reader side ────────────────────────────────────────────────────────
    // Returns true when a newer snapshot was adopted.
    bool update()
    {
        if ((middle_.load(std::memory_order_acquire) & kFresh) == 0) return false;
        const int prev = middle_.exchange(front_, std::memory_order_acq_rel);
        front_ = prev & kIndexMask;
        return true;
    }

    const T& read_buffer() const { return slots_[front_]; }

private:
    static constexpr int kIndexMask = 0x3;
    static constexpr int kFresh     = 0x4;

    T                slots_[3];
    int              front_  = 0;   // owned by the reader
    std::atomic<int> middle_ { 1 };
    int              back_   = 2;   // owned by the writer
};

} // namespace hldsp
