#ifndef LECTERN_UPLOAD_DECODER_HPP
#define LECTERN_UPLOAD_DECODER_HPP

#include "export.hpp"
#include <optional>
#include <string>

namespace lectern
{

struct UploadedFile
{
    std::string filename;
    std::string contentType;
    std::string content;
};

/**
 * @brief Pulls the part named `fieldName` out of a multipart/form-data body.
 *
 * @param contentTypeHeader Value of the request's Content-Type header (carries the boundary)
 * @return The part, or std::nullopt when the body has no such field
 * @throws ValidationError when the header has no boundary or the body is malformed
 */
LECTERN_SERVER_API std::optional<UploadedFile> parseMultipartUpload(const std::string& body,
                                                                    const std::string& contentTypeHeader,
                                                                    const std::string& fieldName = "file");

/**
 * @brief Decodes {"filename": "...", "data": "<base64>"}.
 * @return std::nullopt when either field is missing
 * @throws ValidationError for invalid JSON, wrong field types or bad base64
 */
LECTERN_SERVER_API std::optional<UploadedFile> parseJsonUpload(const std::string& body);

// Value of a `key=value` parameter in a header such as Content-Type or
// Content-Disposition. Surrounding quotes are removed.
LECTERN_SERVER_API std::string headerParameter(const std::string& headerValue, const std::string& key);

} // namespace lectern

#endif // LECTERN_UPLOAD_DECODER_HPP
