#include "test_common.h"
#include "lectern/session/session_store.hpp"
#include "lectern/errors.hpp"
#include <atomic>
#include <cctype>
#include <set>
#include <stdexcept>
#include <thread>

using namespace lectern;
using lectern::document::TextChunk;
using lectern::session::SessionStore;

namespace {

std::vector<TextChunk> make_chunks(size_t n) {
    std::vector<TextChunk> chunks;
    for (size_t i = 0; i < n; ++i)
        chunks.emplace_back("Chunk number " + std::to_string(i) + ".", static_cast<int>(i / 2) + 1, static_cast<long long>(i));
    return chunks;
}

bool looks_like_uuid4(const std::string &id) {
    if (id.size() != 36) return false;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { if (id[i] != '-') return false; continue; }
        if (!std::isxdigit(static_cast<unsigned char>(id[i]))) return false;
    }
    return id[14] == '4';
}

} // namespace

int main() {
    int failures = 0;

    // create / read / status
    {
        SessionStore store;
        auto id = store.createSession(make_chunks(5));
        CHECK(looks_like_uuid4(id));
        CHECK(store.contains(id));
        CHECK(store.size() == 1);

        auto status = store.getStatus(id);
        CHECK(status.currentIndex == 0);
        CHECK(status.totalChunks == 5);
        CHECK(status.currentPage == 1);

        auto read = store.readChunk(id, 3);
        CHECK(read.text == "Chunk number 3.");
        CHECK(read.chunkIndex == 3);
        CHECK(read.pageNumber == 2);

        status = store.getStatus(id);
        CHECK(status.currentIndex == 3);
        CHECK(status.currentPage == 2);

        // re-reading and going backwards are both allowed
        CHECK(store.readChunk(id, 3).chunkIndex == 3);
        CHECK(store.readChunk(id, 0).chunkIndex == 0);
        CHECK(store.getStatus(id).currentIndex == 0);
    }

    // errors
    {
        SessionStore store;
        auto id = store.createSession(make_chunks(2));
        CHECK_THROWS(store.readChunk(id, 2), IndexOutOfRange);
        CHECK_THROWS(store.readChunk(id, -1), IndexOutOfRange);
        CHECK_THROWS(store.readChunk("missing", 0), SessionNotFound);
        CHECK_THROWS(store.getStatus("missing"), SessionNotFound);
        CHECK_THROWS(store.createSession({}), ValidationError);
        CHECK(store.size() == 1);
        CHECK(store.getStatus(id).currentIndex == 0);

        CHECK(store.removeSession(id));
        CHECK(!store.removeSession(id));
        CHECK_THROWS(store.getStatus(id), SessionNotFound);
    }

    CHECK_THROWS(SessionStore(std::chrono::seconds(-1)), std::invalid_argument);

    // ids are unique
    {
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) ids.insert(SessionStore::generateSessionId());
        CHECK(ids.size() == 1000);
    }

    // idle expiry
    {
        SessionStore store(std::chrono::seconds(10));
        auto stale = store.createSession(make_chunks(1));
        auto fresh = store.createSession(make_chunks(1));
        auto now = SessionStore::Clock::now();
        CHECK(store.evictIdle(now) == 0);
        CHECK(store.evictIdle(now + std::chrono::seconds(11)) == 2);
        CHECK(store.size() == 0);

        stale = store.createSession(make_chunks(2));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        fresh = store.createSession(make_chunks(2));
        store.readChunk(fresh, 1);
        auto cutoff = SessionStore::Clock::now() + std::chrono::seconds(10) - std::chrono::milliseconds(10);
        CHECK(store.evictIdle(cutoff) == 1);
        CHECK(!store.contains(stale));
        CHECK(store.contains(fresh));
    }

    // a zero timeout never expires anything
    {
        SessionStore store(std::chrono::seconds(0));
        store.createSession(make_chunks(1));
        CHECK(store.evictIdle(SessionStore::Clock::now() + std::chrono::hours(24 * 365)) == 0);
        store.startEviction();
        store.stopEviction();
        CHECK(store.size() == 1);
    }

    // the eviction thread starts and stops cleanly
    {
        SessionStore store(std::chrono::seconds(3600));
        store.startEviction();
        store.startEviction();
        store.createSession(make_chunks(1));
        store.stopEviction();
        store.stopEviction();
        CHECK(store.size() == 1);
    }

    // capacity: the least recently used session makes room
    {
        SessionStore store(std::chrono::seconds(3600), 2);
        auto a = store.createSession(make_chunks(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto b = store.createSession(make_chunks(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        store.readChunk(a, 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto c = store.createSession(make_chunks(1));
        CHECK(store.size() == 2);
        CHECK(store.contains(a));
        CHECK(!store.contains(b));
        CHECK(store.contains(c));
    }

    // concurrent readers on shared and separate sessions
    {
        SessionStore store;
        const size_t total = 50;
        auto shared = store.createSession(make_chunks(total));
        std::atomic<int> errors{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t]() {
                try {
                    auto own = store.createSession(make_chunks(10));
                    for (int i = 0; i < 200; ++i) {
                        long long idx = (t * 7 + i) % static_cast<long long>(total);
                        auto r = store.readChunk(shared, idx);
                        if (r.chunkIndex != idx) errors++;
                        auto s = store.getStatus(shared);
                        if (s.currentIndex < 0 || s.currentIndex >= static_cast<long long>(total)) errors++;
                        if (store.readChunk(own, i % 10).chunkIndex != i % 10) errors++;
                    }
                    if (!store.removeSession(own)) errors++;
                } catch (const std::exception &e) {
                    std::cerr << "[TEST] worker error: " << e.what() << "\n";
                    errors++;
                }
            });
        }
        for (auto &th : threads) th.join();
        CHECK(errors == 0);
        CHECK(store.size() == 1);
    }

    return report("session_store", failures);
}
