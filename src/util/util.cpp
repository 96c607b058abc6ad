#include "util.hpp"

#include <charconv>
#include <fstream>
#include <stdexcept>

std::vector<std::byte> Util::concatenate(std::vector<std::vector<std::byte>> dataParts)
{
    /* Optimization: Handle the empty case. */
    if (dataParts.empty()) {
        return {};
    }

    /* Optimization: Handle the case where there's only one part, and therefore it can just be moved. */
    if (dataParts.size() == 1) {
        return std::move(dataParts[0]);
    }

    /* Allocate space for a vector of the right size. */
    std::size_t totalSize = 0;
    for (const auto &part: dataParts) {
        totalSize += part.size();
    }

    std::vector<std::byte> allData;
    allData.reserve(totalSize);

    /* Concatenate the buffer. */
    for (auto &part: dataParts) {
        allData.insert(allData.end(), part.begin(), part.end());
        part.clear(); // Don't continue to waste memory :)
    }

    /* Done :) */
    return allData;
}

std::vector<std::byte> Util::readFile(const std::filesystem::path &path)
{
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    f.open(path, std::ios::ate | std::ios::binary);
    size_t size = f.tellg();

    std::vector<std::byte> result(size);
    f.seekg(0);
    f.read((char *)result.data(), size);

    return result;
}

void Util::writeFile(const std::filesystem::path &path, std::string_view contents)
{
    std::ofstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    f.open(path, std::ios::binary | std::ios::trunc);
    f.write(contents.data(), contents.size());
}

int64_t Util::parseInt64(std::string_view string)
{
    int64_t result = 0;
    auto [end, ec] = std::from_chars(string.data(), string.data() + string.size(), result);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range("Integer out of range: \"" + std::string(string) + "\".");
    }
    if (ec != std::errc() || end != string.data() + string.size() || string.empty()) {
        throw std::invalid_argument("Not an integer: \"" + std::string(string) + "\".");
    }
    return result;
}

bool Util::endsWithCaseInsensitive(std::string_view string, std::string_view suffix)
{
    if (suffix.size() > string.size()) {
        return false;
    }
    string = string.substr(string.size() - suffix.size());
    for (size_t i = 0; i < suffix.size(); i++) {
        char a = string[i];
        char b = suffix[i];
        if (a >= 'A' && a <= 'Z') {
            a = (char)(a - 'A' + 'a');
        }
        if (b >= 'A' && b <= 'Z') {
            b = (char)(b - 'A' + 'a');
        }
        if (a != b) {
            return false;
        }
    }
    return true;
}
