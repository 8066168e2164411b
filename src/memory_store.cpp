#include "memory_store.hpp"

namespace veil {

MemoryStore::MemoryStore(Clock clock) : clock_(std::move(clock)) {}

MemoryStore::Entry* MemoryStore::find_live(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (it->second.expires_at && clock_() >= *it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

MemoryStore::Entry& MemoryStore::upsert(const std::string& key, Kind kind) {
    Entry* existing = find_live(key);
    if (existing) {
        if (existing->kind != kind) {
            throw StoreError("WRONGTYPE Operation against a key holding the wrong kind of value: " + key);
        }
        return *existing;
    }
    Entry& fresh = entries_[key];
    fresh.kind = kind;
    return fresh;
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry) return std::nullopt;
    if (entry->kind != Kind::STRING) {
        throw StoreError("WRONGTYPE GET against non-string key: " + key);
    }
    return entry->value;
}

void MemoryStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    // SET overwrites regardless of the previous type, like Redis.
    Entry& entry = entries_[key];
    entry = Entry{};
    entry.kind = Kind::STRING;
    entry.value = value;
    if (ttl.count() > 0) {
        entry.expires_at = clock_() + ttl;
    }
}

bool MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_live(key)) return false;
    entries_.erase(key);
    return true;
}

bool MemoryStore::expire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry) return false;
    if (ttl.count() <= 0) {
        entries_.erase(key);
        return true;
    }
    entry->expires_at = clock_() + ttl;
    return true;
}

void MemoryStore::hset(const std::string& key, const FieldMap& fields) {
    if (fields.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = upsert(key, Kind::HASH);
    for (const auto& [field, value] : fields) {
        entry.fields[field] = value;
    }
}

KeyValueStore::FieldMap MemoryStore::hgetall(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry) return {};
    if (entry->kind != Kind::HASH) {
        throw StoreError("WRONGTYPE HGETALL against non-hash key: " + key);
    }
    return entry->fields;
}

long long MemoryStore::sadd(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = upsert(key, Kind::SET);
    return entry.members.insert(member).second ? 1 : 0;
}

long long MemoryStore::srem(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry) return 0;
    if (entry->kind != Kind::SET) {
        throw StoreError("WRONGTYPE SREM against non-set key: " + key);
    }
    long long removed = static_cast<long long>(entry->members.erase(member));
    if (entry->members.empty()) {
        entries_.erase(key);
    }
    return removed;
}

long long MemoryStore::scard(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry) return 0;
    if (entry->kind != Kind::SET) {
        throw StoreError("WRONGTYPE SCARD against non-set key: " + key);
    }
    return static_cast<long long>(entry->members.size());
}

std::optional<std::chrono::seconds> MemoryStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key);
    if (!entry || !entry->expires_at) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(*entry->expires_at - clock_());
}

size_t MemoryStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at && now >= *it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MemoryStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
