#include "object_header.h"

#include <limits>

// 本文件实现对象头部的构造、拆分与长度字段解析
namespace miniodb {

std::string make_object_header(const std::string& type, std::size_t payload_size) {
    std::string header = type + " " + std::to_string(payload_size);
    header.push_back('\0');
    return header;
}

bool split_object_header(const std::string& bytes, ObjectHeader& header) {
    std::size_t terminator = bytes.find('\0');
    if (terminator == std::string::npos) {
        return false;
    }

    ObjectHeader parsed;
    parsed.text = bytes.substr(0, terminator);
    parsed.terminator = terminator;

    std::size_t start = 0;
    while (true) {
        std::size_t space = parsed.text.find(' ', start);
        if (space == std::string::npos) {
            parsed.fields.push_back(parsed.text.substr(start));
            break;
        }
        parsed.fields.push_back(parsed.text.substr(start, space - start));
        start = space + 1;
    }

    header.text.swap(parsed.text);
    header.terminator = parsed.terminator;
    header.fields.swap(parsed.fields);
    return true;
}

bool parse_decimal_size(const std::string& text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }

    const std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t result = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (result > (max - digit) / 10U) {
            return false;
        }
        result = result * 10U + digit;
    }

    value = result;
    return true;
}

}  // namespace miniodb
