#include "ledgerline/event_store.hpp"
#include "ledgerline/errors.hpp"
#include "ledgerline/helpers.hpp"

#include <mutex>

namespace ledgerline {

const InMemoryEventStore::Stream* InMemoryEventStore::find(const std::string& domain,
                                                           const std::string& root) const {
    auto d = domains_.find(domain);
    if (d == domains_.end()) return nullptr;
    auto s = d->second.find(root);
    return s == d->second.end() ? nullptr : &s->second;
}

EventBook InMemoryEventStore::load(const std::string& domain, const std::string& root) const {
    EventBook book;
    book.mutable_cover()->set_domain(domain);
    book.mutable_cover()->set_root(root);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Stream* stream = find(domain, root);
    if (!stream) return book;

    uint32_t from = 0;
    if (stream->snapshot) {
        *book.mutable_snapshot() = *stream->snapshot;
        from = stream->snapshot->sequence();
    }
    for (const auto& page : stream->pages) {
        if (page.sequence() > from) {
            *book.add_pages() = page;
        }
    }
    return book;
}

uint32_t InMemoryEventStore::version(const std::string& domain, const std::string& root) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Stream* stream = find(domain, root);
    return stream ? last_sequence(*stream) : 0;
}

uint32_t InMemoryEventStore::append(const std::string& domain, const std::string& root,
                                    uint32_t expected_version,
                                    const std::vector<google::protobuf::Any>& events) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& stream = domains_[domain][root];

    uint32_t current = last_sequence(stream);
    if (current != expected_version) {
        throw ConcurrencyConflictError(
            "Stream " + domain + "/" + root + " is at version " + std::to_string(current) +
            ", expected " + std::to_string(expected_version),
            expected_version, current);
    }

    auto created_at = helpers::now();
    for (const auto& event : events) {
        EventPage page;
        page.set_sequence(++current);
        *page.mutable_event() = event;
        *page.mutable_created_at() = created_at;
        stream.pages.push_back(std::move(page));
    }
    return current;
}

void InMemoryEventStore::snapshot(const std::string& domain, const std::string& root,
                                  uint32_t sequence, const google::protobuf::Any& state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& stream = domains_[domain][root];

    uint32_t current = last_sequence(stream);
    if (sequence > current) {
        throw ValidationError("Snapshot sequence " + std::to_string(sequence) +
                              " is ahead of stream " + domain + "/" + root);
    }
    if (stream.snapshot && stream.snapshot->sequence() >= sequence) return;

    Snapshot snap;
    snap.set_sequence(sequence);
    *snap.mutable_state() = state;
    stream.snapshot = std::move(snap);
}

std::vector<EventPage> InMemoryEventStore::read(const std::string& domain, const std::string& root,
                                                uint32_t after_sequence, uint32_t limit) const {
    std::vector<EventPage> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Stream* stream = find(domain, root);
    if (!stream) return result;

    for (const auto& page : stream->pages) {
        if (page.sequence() <= after_sequence) continue;
        result.push_back(page);
        if (limit != 0 && result.size() >= limit) break;
    }
    return result;
}

std::vector<std::string> InMemoryEventStore::roots(const std::string& domain) const {
    std::vector<std::string> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto d = domains_.find(domain);
    if (d == domains_.end()) return result;
    for (const auto& [root, stream] : d->second) {
        if (!stream.pages.empty()) result.push_back(root);
    }
    return result;
}

} // namespace ledgerline
