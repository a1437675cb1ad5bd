#include "lectern/session/session_store.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace lectern
{
namespace session
{

SessionStore::SessionStore(std::chrono::seconds idleTimeout, size_t maxSessions)
    : idleTimeout_(idleTimeout), maxSessions_(maxSessions)
{
    if (idleTimeout_.count() < 0)
    {
        throw std::invalid_argument("session idle timeout must not be negative");
    }
}

SessionStore::~SessionStore()
{
    stopEviction();
}

std::string SessionStore::generateSessionId()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<uint32_t> dis(0, 0xFFFFFFFF);
    static thread_local std::uniform_int_distribution<uint32_t> dis16(0, 0xFFFF);
    static thread_local std::uniform_int_distribution<uint32_t> dis8(0, 0xFF);

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in [89ab]
    uint32_t timeLow = dis(gen);
    uint32_t timeMid = dis16(gen);
    uint32_t timeHiAndVersion = (dis16(gen) & 0x0FFF) | 0x4000;
    uint32_t clockSeqHi = (dis8(gen) & 0x3F) | 0x80;
    uint32_t clockSeqLow = dis8(gen);
    uint64_t node = (static_cast<uint64_t>(dis(gen)) << 16) | dis16(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << timeLow << "-";
    ss << std::setw(4) << timeMid << "-";
    ss << std::setw(4) << timeHiAndVersion << "-";
    ss << std::setw(2) << clockSeqHi;
    ss << std::setw(2) << clockSeqLow << "-";
    ss << std::setw(12) << node;
    return ss.str();
}

std::string SessionStore::createSession(std::vector<document::TextChunk> chunks)
{
    if (chunks.empty())
    {
        throw ValidationError("Cannot create a session without chunks");
    }

    const size_t total = chunks.size();
    std::string sessionId;
    {
        std::unique_lock<std::shared_mutex> mapLock(sessionsMutex_);

        do
        {
            sessionId = generateSessionId();
        } while (sessions_.count(sessionId) > 0);

        if (maxSessions_ > 0)
        {
            while (sessions_.size() >= maxSessions_)
            {
                evictLeastRecentlyUsedLocked();
            }
        }

        sessions_.emplace(sessionId, std::make_shared<Session>(sessionId, std::move(chunks)));
    }

    ServerLogger::logInfo("Created session %s with %zu chunks", sessionId.c_str(), total);
    return sessionId;
}

std::shared_ptr<SessionStore::Session> SessionStore::find(const std::string& sessionId) const
{
    std::shared_lock<std::shared_mutex> mapLock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
    {
        return nullptr;
    }
    return it->second;
}

ChunkReadResult SessionStore::readChunk(const std::string& sessionId, long long index)
{
    auto session = find(sessionId);
    if (!session)
    {
        throw SessionNotFound(sessionId);
    }

    const size_t total = session->chunks.size();
    if (index < 0 || static_cast<unsigned long long>(index) >= total)
    {
        throw IndexOutOfRange(index, total);
    }

    const auto& chunk = session->chunks[static_cast<size_t>(index)];
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->currentIndex = index;
        session->lastAccessed = Clock::now();
    }

    ServerLogger::logDebug("Session %s moved to chunk %lld of %zu", sessionId.c_str(), index, total);
    return ChunkReadResult{chunk.text(), chunk.pageNumber(), chunk.chunkIndex()};
}

SessionStatus SessionStore::getStatus(const std::string& sessionId) const
{
    auto session = find(sessionId);
    if (!session)
    {
        throw SessionNotFound(sessionId);
    }
    if (session->chunks.empty())
    {
        throw NoContent();
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    const auto& current = session->chunks[static_cast<size_t>(session->currentIndex)];
    return SessionStatus{session->currentIndex, session->chunks.size(), current.pageNumber()};
}

bool SessionStore::removeSession(const std::string& sessionId)
{
    std::unique_lock<std::shared_mutex> mapLock(sessionsMutex_);
    if (sessions_.erase(sessionId) == 0)
    {
        return false;
    }
    ServerLogger::logInfo("Removed session %s", sessionId.c_str());
    return true;
}

bool SessionStore::contains(const std::string& sessionId) const
{
    std::shared_lock<std::shared_mutex> mapLock(sessionsMutex_);
    return sessions_.count(sessionId) > 0;
}

size_t SessionStore::size() const
{
    std::shared_lock<std::shared_mutex> mapLock(sessionsMutex_);
    return sessions_.size();
}

void SessionStore::evictLeastRecentlyUsedLocked()
{
    auto oldest = sessions_.end();
    Clock::time_point oldestAccess = Clock::time_point::max();

    for (auto it = sessions_.begin(); it != sessions_.end(); ++it)
    {
        std::lock_guard<std::mutex> lock(it->second->mutex);
        if (it->second->lastAccessed < oldestAccess)
        {
            oldestAccess = it->second->lastAccessed;
            oldest = it;
        }
    }

    if (oldest != sessions_.end())
    {
        ServerLogger::logInfo("Session limit of %zu reached, evicting least recently used session %s",
                              maxSessions_, oldest->first.c_str());
        sessions_.erase(oldest);
    }
}

size_t SessionStore::evictIdle(Clock::time_point now)
{
    if (idleTimeout_.count() == 0)
    {
        return 0;
    }

    auto isIdle = [this, now](const Session& session) {
        std::lock_guard<std::mutex> lock(session.mutex);
        return now - session.lastAccessed >= idleTimeout_;
    };

    // Find candidates without blocking readers, then re-check under the write lock
    std::vector<std::string> candidates;
    {
        std::shared_lock<std::shared_mutex> mapLock(sessionsMutex_);
        for (const auto& [id, session] : sessions_)
        {
            if (isIdle(*session))
            {
                candidates.push_back(id);
            }
        }
    }

    if (candidates.empty())
    {
        return 0;
    }

    size_t evicted = 0;
    std::unique_lock<std::shared_mutex> mapLock(sessionsMutex_);
    for (const auto& id : candidates)
    {
        auto it = sessions_.find(id);
        if (it != sessions_.end() && isIdle(*it->second))
        {
            sessions_.erase(it);
            ++evicted;
            ServerLogger::logInfo("Session %s expired after %lld seconds of inactivity",
                                  id.c_str(), static_cast<long long>(idleTimeout_.count()));
        }
    }
    return evicted;
}

void SessionStore::startEviction()
{
    if (idleTimeout_.count() == 0)
    {
        ServerLogger::logInfo("Session expiry disabled");
        return;
    }
    if (evictionThread_.joinable())
    {
        return;
    }
    stopEviction_.store(false);
    evictionThread_ = std::thread(&SessionStore::evictionLoop, this);
}

void SessionStore::stopEviction()
{
    stopEviction_.store(true);
    {
        std::lock_guard<std::mutex> lock(evictionMutex_);
        evictionCv_.notify_one();
    }
    if (evictionThread_.joinable())
    {
        evictionThread_.join();
    }
}

void SessionStore::evictionLoop()
{
    ServerLogger::logDebug("Session eviction thread started");

    // At most half the idle timeout between sweeps, at least one second
    const auto interval = (std::max)(std::chrono::duration_cast<std::chrono::seconds>(idleTimeout_ / 2),
                                     std::chrono::seconds(1));

    while (!stopEviction_.load())
    {
        {
            std::unique_lock<std::mutex> lock(evictionMutex_);
            if (evictionCv_.wait_for(lock, interval, [this] { return stopEviction_.load(); }))
            {
                break;
            }
        }

        size_t evicted = evictIdle(Clock::now());
        if (evicted > 0)
        {
            ServerLogger::logInfo("Evicted %zu idle sessions, %zu remaining", evicted, size());
        }
    }

    ServerLogger::logDebug("Session eviction thread finished");
}

} // namespace session
} // namespace lectern
