#include "local_store.hpp"

namespace motium::sync {

std::optional<EntityRecord> InMemoryLocalStore::get(EntityType entity_type,
                                                    const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find({entity_type, entity_id});
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<EntityRecord> InMemoryLocalStore::list(EntityType entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntityRecord> result;
    for (const auto& [key, entry] : entities_) {
        if (key.first == entity_type) {
            result.push_back(entry.record);
        }
    }
    return result;
}

bool InMemoryLocalStore::upsert(const EntityRecord& record, bool mark_dirty) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entities_[{record.entity_type, record.entity_id}];
    entry.record = record;
    entry.dirty = mark_dirty;
    return true;
}

bool InMemoryLocalStore::remove(EntityType entity_type, const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.erase({entity_type, entity_id}) > 0;
}

std::vector<EntityRecord> InMemoryLocalStore::list_dirty(EntityType entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntityRecord> result;
    for (const auto& [key, entry] : entities_) {
        if (key.first == entity_type && entry.dirty) {
            result.push_back(entry.record);
        }
    }
    return result;
}

bool InMemoryLocalStore::is_dirty(EntityType entity_type, const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find({entity_type, entity_id});
    return it != entities_.end() && it->second.dirty;
}

bool InMemoryLocalStore::clear_dirty(EntityType entity_type, const std::string& entity_id,
                                     int64_t pushed_updated_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find({entity_type, entity_id});
    if (it == entities_.end() || !it->second.dirty) {
        return false;
    }
    if (it->second.record.updated_at_ms > pushed_updated_at_ms) {
        return false;
    }
    it->second.dirty = false;
    return true;
}

int64_t InMemoryLocalStore::last_pull_watermark(EntityType entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watermarks_.find(entity_type);
    return it == watermarks_.end() ? 0 : it->second;
}

bool InMemoryLocalStore::set_last_pull_watermark(EntityType entity_type,
                                                 int64_t watermark_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    watermarks_[entity_type] = watermark_ms;
    return true;
}

bool InMemoryLocalStore::reset_pull_watermarks() {
    std::lock_guard<std::mutex> lock(mutex_);
    watermarks_.clear();
    return true;
}

}  // namespace motium::sync
