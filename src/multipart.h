#pragma once

#include <map>
#include <string>
#include <vector>

namespace pyexec {

// Represents a single part in multipart form data
struct MultipartPart {
    std::map<std::string, std::string> headers;
    std::string name;
    std::string filename;
    std::string data;
};

// Simple multipart/form-data parser
class MultipartParser {
public:
    static std::vector<MultipartPart> parse(
        const std::string& content_type,
        const std::string& body
    );

    // First part with the given form field name, nullptr if none
    static const MultipartPart* find(const std::vector<MultipartPart>& parts,
                                     const std::string& name);

private:
    static std::string extract_boundary(const std::string& content_type);
    static std::string extract_param(const std::string& disposition, const std::string& param);
    static MultipartPart parse_part(const std::string& part_data);
};

} // namespace pyexec
