/**
 * @file KeyedMutex.hpp
 * @brief One mutex per string key, created on demand and released when unused.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace reflectcore::application {

/**
 * @class KeyedMutex
 * @brief Serializes work per key (Turn id, pattern kind|key) while distinct keys proceed in parallel.
 */
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        int users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key) : m_owner(owner), m_key(std::move(key)) {
            {
                std::lock_guard<std::mutex> lock(m_owner.m_mapMutex);
                auto& slot = m_owner.m_slots[m_key];
                if (!slot) slot = std::make_shared<Slot>();
                slot->users++;
                m_slot = slot;
            }
            m_slot->mutex.lock();
        }

        ~Guard() {
            m_slot->mutex.unlock();
            std::lock_guard<std::mutex> lock(m_owner.m_mapMutex);
            if (--m_slot->users == 0) {
                m_owner.m_slots.erase(m_key);
            }
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& m_owner;
        std::string m_key;
        std::shared_ptr<Slot> m_slot;
    };

    Guard lock(const std::string& key) { return Guard(*this, key); }

private:
    std::mutex m_mapMutex;
    std::map<std::string, std::shared_ptr<Slot>> m_slots;
};

} // namespace reflectcore::application
