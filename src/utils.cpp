#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <random>
#include <sstream>

namespace Lempctl {

std::string trim(const std::string& s)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

std::string toLower(const std::string& s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> splitCommaList(const std::string& list)
{
    std::vector<std::string> items;
    std::istringstream iss(list);
    std::string item;

    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

/**
 * @brief Builds "YYYY-MM-DD HH:MM:SS+hh:mm", the same layout as
 *        `date --rfc-3339=s`.
 */
std::string currentTimestamp()
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    // strftime gives "+hhmm"; RFC 3339 wants "+hh:mm"
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &local);
    std::string offset = zone;
    if (offset.size() == 5) {
        offset.insert(3, ":");
    }
    return std::string(date) + offset;
}

std::string generatePassword(std::size_t length)
{
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789";

    std::random_device rd;
    std::mt19937 mt(rd());
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

    std::string password;
    password.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        password += alphabet[dist(mt)];
    }
    return password;
}

} // namespace Lempctl
