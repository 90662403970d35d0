#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <optional>
#include <ostream>

namespace handtone {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event,
        Error
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[64];  // Static message (for Type::Message / Type::Error)
    uint64_t timestamp; // Steady clock, microseconds
};

/**
 * @brief A bounded lock-free RingBuffer for RT-Safe logging.
 *
 * Any number of threads may push and pop. Each slot carries a sequence
 * number; writers claim a slot by advancing head with a compare-and-swap,
 * then publish it by bumping the slot's sequence.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    LockFreeRingBuffer() {
        for (size_t i = 0; i < Size; ++i) {
            slots[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    bool push(const T& item) {
        size_t pos = head.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        while (true) {
            slot = &slots[pos & mask];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
            if (diff == 0) {
                if (head.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) break;
            } else if (diff < 0) {
                return false; // Full
            } else {
                pos = head.load(std::memory_order_relaxed);
            }
        }

        slot->item = item;
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t pos = tail.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        while (true) {
            slot = &slots[pos & mask];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos + 1);
            if (diff == 0) {
                if (tail.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) break;
            } else if (diff < 0) {
                return std::nullopt; // Empty, or the next slot is still being written
            } else {
                pos = tail.load(std::memory_order_relaxed);
            }
        }

        T item = slot->item;
        slot->sequence.store(pos + Size, std::memory_order_release);
        return item;
    }

    bool empty() const {
        const size_t pos = tail.load(std::memory_order_acquire);
        return slots[pos & mask].sequence.load(std::memory_order_acquire) != pos + 1;
    }

    static constexpr size_t capacity() { return Size; }

private:
    struct Slot {
        std::atomic<size_t> sequence{0};
        T item{};
    };

    static constexpr size_t mask = Size - 1;
    std::array<Slot, Size> slots;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton Logger for Audio Thread telemetry.
 *
 * Every engine's audio thread produces into the same ring. Controller-side
 * code drains it with pop_entry() or flush(). Entries are dropped when full.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    bool log_message(const char* tag, const char* msg) {
        return push(LogEntry::Type::Message, tag, msg, 0.0f);
    }

    bool log_event(const char* tag, float value) {
        return push(LogEntry::Type::Event, tag, "", value);
    }

    bool log_error(const char* tag, const char* msg) {
        return push(LogEntry::Type::Error, tag, msg, 0.0f);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain every pending entry into a stream.
     *
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->tag << "] ";
            switch (entry->type) {
                case LogEntry::Type::Message:
                    out << entry->message;
                    break;
                case LogEntry::Type::Event:
                    out << entry->value;
                    break;
                case LogEntry::Type::Error:
                    out << "ERROR: " << entry->message;
                    break;
            }
            out << '\n';
            ++count;
        }
        out.flush();
        return count;
    }

    /**
     * @brief Entries lost to a full ring since the last clear().
     */
    size_t dropped_count() const {
        return dropped.load(std::memory_order_relaxed);
    }

    /**
     * @brief Discard all pending entries.
     */
    void clear() {
        while (ring_buffer.pop()) {}
        dropped.store(0, std::memory_order_relaxed);
    }

private:
    AudioLogger() = default;

    bool push(LogEntry::Type type, const char* tag, const char* msg, float value) {
        LogEntry entry{};
        entry.type = type;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.value = value;
        entry.timestamp = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count());
        if (!ring_buffer.push(entry)) {
            dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic<size_t> dropped{0};
};

} // namespace handtone
