#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "ledgerline/types.pb.h"

namespace ledgerline {

/**
 * Append-only event streams addressed by (domain, root).
 *
 * This is the persistence seam. The only write is a conditional append:
 * it succeeds when the stream is still at expected_version and raises
 * ConcurrencyConflictError otherwise. Events are never updated or removed.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    /**
     * Latest snapshot (if any) plus every page after it.
     */
    virtual EventBook load(const std::string& domain, const std::string& root) const = 0;

    /**
     * Sequence of the last event in a stream, 0 when empty.
     */
    virtual uint32_t version(const std::string& domain, const std::string& root) const = 0;

    /**
     * Append events atomically. Pages receive consecutive sequence numbers
     * starting at expected_version + 1.
     *
     * @return the new stream version
     * @throws ConcurrencyConflictError if the stream moved past expected_version
     */
    virtual uint32_t append(const std::string& domain, const std::string& root,
                            uint32_t expected_version,
                            const std::vector<google::protobuf::Any>& events) = 0;

    /**
     * Store a checkpoint of folded state at the given sequence.
     */
    virtual void snapshot(const std::string& domain, const std::string& root,
                          uint32_t sequence, const google::protobuf::Any& state) = 0;

    /**
     * Full history after a sequence, regardless of snapshots. limit 0 = all.
     */
    virtual std::vector<EventPage> read(const std::string& domain, const std::string& root,
                                        uint32_t after_sequence, uint32_t limit = 0) const = 0;

    /**
     * Every stream root known in a domain.
     */
    virtual std::vector<std::string> roots(const std::string& domain) const = 0;
};

/**
 * Thread-safe in-process event store.
 */
class InMemoryEventStore : public EventStore {
public:
    EventBook load(const std::string& domain, const std::string& root) const override;

    uint32_t version(const std::string& domain, const std::string& root) const override;

    uint32_t append(const std::string& domain, const std::string& root,
                    uint32_t expected_version,
                    const std::vector<google::protobuf::Any>& events) override;

    void snapshot(const std::string& domain, const std::string& root,
                  uint32_t sequence, const google::protobuf::Any& state) override;

    std::vector<EventPage> read(const std::string& domain, const std::string& root,
                                uint32_t after_sequence, uint32_t limit = 0) const override;

    std::vector<std::string> roots(const std::string& domain) const override;

private:
    struct Stream {
        std::vector<EventPage> pages;
        std::optional<Snapshot> snapshot;
    };

    const Stream* find(const std::string& domain, const std::string& root) const;
    static uint32_t last_sequence(const Stream& stream) {
        return stream.pages.empty() ? 0 : stream.pages.back().sequence();
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::map<std::string, Stream>> domains_;
};

} // namespace ledgerline
