#ifndef LECTERN_SESSION_STORE_HPP
#define LECTERN_SESSION_STORE_HPP

#include "../export.hpp"
#include "../document/text_chunk.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lectern
{
namespace session
{

struct ChunkReadResult
{
    std::string text;
    int pageNumber;
    long long chunkIndex;
};

struct SessionStatus
{
    long long currentIndex;
    size_t totalChunks;
    int currentPage;
};

/**
 * @brief In-memory registry of reading sessions.
 *
 * Each session owns the immutable chunk list of one uploaded document plus a
 * read cursor. The map is guarded by a reader/writer lock; each session has its
 * own mutex for the cursor and last-access time, so reads on different sessions
 * never wait on each other.
 *
 * Sessions idle for longer than the idle timeout are dropped by the eviction
 * thread once startEviction() has been called. A timeout of zero disables
 * expiry.
 */
class LECTERN_SERVER_API SessionStore
{
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionStore(std::chrono::seconds idleTimeout = std::chrono::seconds(3600),
                          size_t maxSessions = 0);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;
    SessionStore(SessionStore&&) = delete;
    SessionStore& operator=(SessionStore&&) = delete;

    /**
     * @brief Registers a new session positioned on chunk 0.
     * @throws ValidationError when chunks is empty
     * @return The new session id (UUID v4 text form)
     */
    std::string createSession(std::vector<document::TextChunk> chunks);

    /**
     * @brief Moves the cursor of a session to `index` and returns that chunk.
     * @throws SessionNotFound for an unknown id
     * @throws IndexOutOfRange when index is negative or past the last chunk
     */
    ChunkReadResult readChunk(const std::string& sessionId, long long index);

    // @throws SessionNotFound, NoContent
    SessionStatus getStatus(const std::string& sessionId) const;

    bool removeSession(const std::string& sessionId);
    bool contains(const std::string& sessionId) const;
    size_t size() const;

    // Removes every session whose last access is older than now - idleTimeout.
    size_t evictIdle(Clock::time_point now);

    void startEviction();
    void stopEviction();

    std::chrono::seconds idleTimeout() const { return idleTimeout_; }
    size_t maxSessions() const { return maxSessions_; }

    static std::string generateSessionId();

private:
    struct Session
    {
        Session(std::string sessionId, std::vector<document::TextChunk> sessionChunks)
            : id(std::move(sessionId)), chunks(std::move(sessionChunks)), currentIndex(0),
              lastAccessed(Clock::now()) {}

        const std::string id;
        const std::vector<document::TextChunk> chunks;
        long long currentIndex;
        Clock::time_point lastAccessed;
        mutable std::mutex mutex;
    };

    std::shared_ptr<Session> find(const std::string& sessionId) const;

    // Caller holds sessionsMutex_ exclusively.
    void evictLeastRecentlyUsedLocked();

    void evictionLoop();

    std::chrono::seconds idleTimeout_;
    size_t maxSessions_;

#pragma warning(push)
#pragma warning(disable: 4251)
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::shared_mutex sessionsMutex_;

    std::thread evictionThread_;
    std::atomic<bool> stopEviction_{false};
    std::condition_variable evictionCv_;
    std::mutex evictionMutex_;
#pragma warning(pop)
};

} // namespace session
} // namespace lectern

#endif // LECTERN_SESSION_STORE_HPP
