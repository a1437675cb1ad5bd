#ifndef LECTERN_ERRORS_HPP
#define LECTERN_ERRORS_HPP

#include "export.hpp"
#include <stdexcept>
#include <string>

namespace lectern
{

/**
 * @brief Base class of every error the reading pipeline reports to callers.
 *
 * Routes translate the concrete subclasses into HTTP status codes; anything
 * else that escapes a handler is answered with 500.
 */
class LECTERN_SERVER_API LecternError : public std::runtime_error
{
public:
    explicit LecternError(const std::string& message) : std::runtime_error(message) {}
};

// Caller supplied input of the wrong shape (empty text, not a document, bad percentage).
class LECTERN_SERVER_API ValidationError : public LecternError
{
public:
    explicit ValidationError(const std::string& message) : LecternError(message) {}
};

/**
 * @brief The document library could not read the document or one of its pages.
 *
 * page() is the 1-based page that failed, or 0 when the whole document is unreadable.
 */
class LECTERN_SERVER_API ExtractionFailed : public LecternError
{
public:
    ExtractionFailed(int page, const std::string& message)
        : LecternError(page > 0 ? "Error processing page " + std::to_string(page) + ": " + message
                                : message),
          page_(page)
    {
    }

    int page() const { return page_; }

private:
    int page_;
};

class LECTERN_SERVER_API SessionNotFound : public LecternError
{
public:
    explicit SessionNotFound(const std::string& sessionId)
        : LecternError("Session not found"), sessionId_(sessionId) {}

    const std::string& sessionId() const { return sessionId_; }

private:
    std::string sessionId_;
};

class LECTERN_SERVER_API IndexOutOfRange : public LecternError
{
public:
    IndexOutOfRange(long long index, size_t total)
        : LecternError("Invalid chunk index"), index_(index), total_(total) {}

    long long index() const { return index_; }
    size_t total() const { return total_; }

private:
    long long index_;
    size_t total_;
};

class LECTERN_SERVER_API NoContent : public LecternError
{
public:
    NoContent() : LecternError("No content available in session") {}
};

// The speech backend failed; not something the caller can fix.
class LECTERN_SERVER_API SynthesisFailed : public LecternError
{
public:
    explicit SynthesisFailed(const std::string& message) : LecternError(message) {}
};

} // namespace lectern

#endif // LECTERN_ERRORS_HPP
