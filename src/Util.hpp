#ifndef EXCISE_UTIL_HPP
#define EXCISE_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Errors.hpp"

namespace Excise
{

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string loadFileToString(const std::filesystem::path & path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw IOError(path, "could not open file for reading");
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw IOError(path, "read failed");
    }
    file.close();
    return content;
}

// Writes in place, truncating. Callers that must not leave a partial file
// behind go through TempFile instead.
void saveStringToFile(std::string_view content, const std::filesystem::path & path)
{
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw IOError(path, "could not open file for writing");
    }
    file << content;
    file.close();
    if (file.fail())
    {
        throw IOError(path, "write failed");
    }
}

// A string builder that can append std::string, std::string_view, and const char *
// Reduces copys at best effort
class StringBuilder
{
public:
    StringBuilder() : bufferSize(0) {}

    // Use only reference to the string
    void append(std::string_view str)
    {
        buffer.emplace_back(str);
        bufferSize += str.size();
    }

    // Concatenate all segments into a single string
    std::string str() const
    {
        std::string result;
        result.reserve(bufferSize + 32);
        for (std::string_view segment : buffer)
        {
            result.append(segment);
        }
        return result;
    }
private:
    std::vector<std::string_view> buffer;
    size_t bufferSize;
};

bool isAllWhitespace(std::string_view s)
{
    return s.find_first_not_of(" \t\n\v\f\r") == std::string_view::npos;
}

// Leading spaces and tabs, each counted as one column
std::string_view leadingWhitespace(std::string_view s)
{
    std::size_t pos = s.find_first_not_of(" \t");
    if (pos == std::string_view::npos) return s;
    return s.substr(0, pos);
}

std::string_view trim(std::string_view s)
{
    std::size_t begin = s.find_first_not_of(" \t\n\v\f\r");
    if (begin == std::string_view::npos) return {};
    std::size_t end = s.find_last_not_of(" \t\n\v\f\r");
    return s.substr(begin, end - begin + 1);
}

} // namespace Excise

#endif // EXCISE_UTIL_HPP
