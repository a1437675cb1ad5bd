#include "lectern/upload_decoder.hpp"
#include "lectern/errors.hpp"
#include "lectern/utils.hpp"
#include <json.hpp>

namespace lectern
{

namespace
{

std::string trimSpaces(const std::string& value)
{
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos)
    {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

} // namespace

std::string headerParameter(const std::string& headerValue, const std::string& key)
{
    const std::string wanted = to_lower(key);
    size_t pos = 0;

    while (pos <= headerValue.size())
    {
        // Quoted values may contain ';', so scan by hand instead of splitting
        size_t eq = headerValue.find('=', pos);
        if (eq == std::string::npos)
        {
            break;
        }

        size_t nameStart = headerValue.rfind(';', eq);
        nameStart = (nameStart == std::string::npos || nameStart < pos) ? pos : nameStart + 1;
        std::string name = to_lower(trimSpaces(headerValue.substr(nameStart, eq - nameStart)));

        std::string value;
        size_t cursor = eq + 1;
        while (cursor < headerValue.size() && (headerValue[cursor] == ' ' || headerValue[cursor] == '\t'))
        {
            ++cursor;
        }

        if (cursor < headerValue.size() && headerValue[cursor] == '"')
        {
            ++cursor;
            while (cursor < headerValue.size() && headerValue[cursor] != '"')
            {
                if (headerValue[cursor] == '\\' && cursor + 1 < headerValue.size())
                {
                    ++cursor;
                }
                value += headerValue[cursor++];
            }
            size_t next = headerValue.find(';', cursor);
            pos = next == std::string::npos ? headerValue.size() + 1 : next + 1;
        }
        else
        {
            size_t next = headerValue.find(';', cursor);
            value = trimSpaces(headerValue.substr(cursor, next == std::string::npos ? std::string::npos : next - cursor));
            pos = next == std::string::npos ? headerValue.size() + 1 : next + 1;
        }

        if (name == wanted)
        {
            return value;
        }
    }

    return "";
}

std::optional<UploadedFile> parseMultipartUpload(const std::string& body,
                                                 const std::string& contentTypeHeader,
                                                 const std::string& fieldName)
{
    const std::string boundary = headerParameter(contentTypeHeader, "boundary");
    if (boundary.empty())
    {
        throw ValidationError("Missing multipart boundary");
    }

    const std::string delimiter = "--" + boundary;
    size_t pos = body.find(delimiter);
    if (pos == std::string::npos)
    {
        throw ValidationError("Malformed multipart body");
    }

    while (true)
    {
        pos += delimiter.size();

        // "--" right after a delimiter closes the body
        if (body.compare(pos, 2, "--") == 0)
        {
            return std::nullopt;
        }
        if (body.compare(pos, 2, "\r\n") != 0)
        {
            throw ValidationError("Malformed multipart body");
        }
        pos += 2;

        size_t headersEnd = body.find("\r\n\r\n", pos);
        if (headersEnd == std::string::npos)
        {
            throw ValidationError("Malformed multipart part headers");
        }

        size_t contentStart = headersEnd + 4;
        size_t next = body.find("\r\n" + delimiter, contentStart);
        if (next == std::string::npos)
        {
            throw ValidationError("Unterminated multipart body");
        }

        std::string disposition;
        std::string partType;
        size_t lineStart = pos;
        while (lineStart < headersEnd)
        {
            size_t lineEnd = body.find("\r\n", lineStart);
            if (lineEnd == std::string::npos || lineEnd > headersEnd)
            {
                lineEnd = headersEnd;
            }
            std::string line = body.substr(lineStart, lineEnd - lineStart);
            size_t colon = line.find(':');
            if (colon != std::string::npos)
            {
                std::string name = to_lower(trimSpaces(line.substr(0, colon)));
                std::string value = trimSpaces(line.substr(colon + 1));
                if (name == "content-disposition")
                {
                    disposition = value;
                }
                else if (name == "content-type")
                {
                    partType = value;
                }
            }
            lineStart = lineEnd + 2;
        }

        if (headerParameter(disposition, "name") == fieldName)
        {
            UploadedFile file;
            file.filename = headerParameter(disposition, "filename");
            file.contentType = partType;
            file.content = body.substr(contentStart, next - contentStart);
            return file;
        }

        pos = next + 2;
    }
}

std::optional<UploadedFile> parseJsonUpload(const std::string& body)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw ValidationError(std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("filename") || !j.contains("data"))
    {
        return std::nullopt;
    }
    if (!j["filename"].is_string() || !j["data"].is_string())
    {
        throw ValidationError("Fields 'filename' and 'data' must be strings");
    }

    UploadedFile file;
    file.filename = j["filename"].get<std::string>();
    file.contentType = "application/pdf";

    try
    {
        auto bytes = base64_decode(j["data"].get<std::string>());
        file.content.assign(bytes.begin(), bytes.end());
    }
    catch (const std::invalid_argument& e)
    {
        throw ValidationError(std::string("Field 'data' is not valid base64: ") + e.what());
    }

    return file;
}

} // namespace lectern
