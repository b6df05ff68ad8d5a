#include "util.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

std::vector<std::byte> Util::readFile(const std::filesystem::path &path)
{
    std::ifstream stream;
    stream.exceptions(std::ios::badbit | std::ios::failbit);
    stream.open(path, std::ios::binary);

    std::vector<std::byte> contents(std::filesystem::file_size(path));
    stream.read((char *)contents.data(), (std::streamsize)contents.size());
    return contents;
}

void Util::split(std::string_view string, std::initializer_list<std::reference_wrapper<std::string_view>> parts,
                 char separator)
{
    size_t separators = (size_t)std::count(string.begin(), string.end(), separator);
    if (separators + 1 != parts.size()) {
        throw std::invalid_argument("Expected " + std::to_string(parts.size()) + " parts separated by '" +
                                    separator + "', got " + std::to_string(separators + 1) + ".");
    }

    size_t start = 0;
    for (std::string_view &part: parts) {
        size_t end = std::min(string.find(separator, start), string.size());
        part = string.substr(start, end - start);
        start = end + 1;
    }
}

uint64_t Util::parseUint64(std::string_view string)
{
    if (string.empty()) {
        throw std::invalid_argument("Empty integer.");
    }

    uint64_t result = 0;
    for (char c: string) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Integer contains a non-digit character.");
        }
        uint64_t digit = c - '0';
        if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw std::out_of_range("Integer does not fit in 64 bits.");
        }
        result = result * 10 + digit;
    }
    return result;
}

std::string_view Util::trim(std::string_view string)
{
    size_t start = string.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = string.find_last_not_of(" \t");
    return string.substr(start, end - start + 1);
}
