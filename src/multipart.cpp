#include "multipart.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pyexec {

std::vector<MultipartPart> MultipartParser::parse(
    const std::string& content_type,
    const std::string& body
) {
    std::vector<MultipartPart> parts;

    // Extract boundary from content-type
    std::string boundary = extract_boundary(content_type);
    if (boundary.empty()) return parts;

    // Parts are separated by CRLF--boundary
    std::string delimiter = "--" + boundary;
    size_t start = body.find(delimiter);
    if (start == std::string::npos) return parts;

    while (true) {
        start += delimiter.length();

        // Closing delimiter
        if (body.compare(start, 2, "--") == 0) break;

        // Skip the line break after the delimiter
        if (body.compare(start, 2, "\r\n") == 0) start += 2;
        else if (body.compare(start, 1, "\n") == 0) start += 1;

        size_t end = body.find("\r\n" + delimiter, start);
        size_t separator = 2;
        if (end == std::string::npos) {
            end = body.find("\n" + delimiter, start);
            separator = 1;
        }
        if (end == std::string::npos) break;    // truncated body

        MultipartPart part = parse_part(body.substr(start, end - start));
        if (!part.name.empty()) {
            parts.push_back(std::move(part));
        }
        start = end + separator;
    }

    return parts;
}

const MultipartPart* MultipartParser::find(const std::vector<MultipartPart>& parts,
                                           const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) return &part;
    }
    return nullptr;
}

std::string MultipartParser::extract_boundary(const std::string& content_type) {
    std::string boundary_prefix = "boundary=";
    size_t pos = content_type.find(boundary_prefix);
    if (pos == std::string::npos) return "";

    pos += boundary_prefix.length();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.length();

    std::string boundary = content_type.substr(pos, end - pos);

    // Remove quotes if present
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.length() - 2);
    }

    return boundary;
}

// Quoted parameter of a Content-Disposition value; "name" never matches
// inside "filename"
std::string MultipartParser::extract_param(const std::string& disposition,
                                           const std::string& param) {
    std::string needle = param + "=\"";
    size_t pos = 0;
    while ((pos = disposition.find(needle, pos)) != std::string::npos) {
        bool at_boundary = pos == 0 || disposition[pos - 1] == ' ' || disposition[pos - 1] == ';';
        if (at_boundary) {
            size_t value_start = pos + needle.size();
            size_t value_end = disposition.find('"', value_start);
            if (value_end == std::string::npos) return "";
            return disposition.substr(value_start, value_end - value_start);
        }
        pos += needle.size();
    }
    return "";
}

MultipartPart MultipartParser::parse_part(const std::string& part_data) {
    MultipartPart part;

    // Find headers end
    size_t headers_end = part_data.find("\r\n\r\n");
    size_t content_start = headers_end + 4;
    if (headers_end == std::string::npos) {
        headers_end = part_data.find("\n\n");
        if (headers_end == std::string::npos) return part;
        content_start = headers_end + 2;
    }

    std::string headers_section = part_data.substr(0, headers_end);

    // Parse headers
    std::istringstream headers_stream(headers_section);
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
        part.headers[key] = value;

        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        // Parse Content-Disposition for name and filename
        if (lower_key == "content-disposition") {
            part.name = extract_param(value, "name");
            part.filename = extract_param(value, "filename");
        }
    }

    // Get content
    part.data = part_data.substr(content_start);

    return part;
}

} // namespace pyexec
