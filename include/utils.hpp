#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_OK    "\033[33m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Lempctl {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a success message to standard error with yellow coloring.
 *
 * @param message The message to log.
 */
inline void log_ok(const std::string &message)
{
    std::cerr << COLOR_OK << "[OK] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
std::string trim(const std::string& s);

/**
 * @brief Returns a lower-cased copy of the input.
 */
std::string toLower(const std::string& s);

/**
 * @brief Case-insensitive substring search.
 *
 * @param haystack The text to search in.
 * @param needle   The text to look for.
 * @return True if needle occurs anywhere in haystack, ignoring ASCII case.
 */
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

/**
 * @brief Splits a comma-separated list into its items.
 *
 * Items are trimmed and empty items (from "a,,b" or a trailing comma) are
 * dropped. Duplicates are preserved in order.
 *
 * @param list The comma-separated input, e.g. "curl,gd,mbstring".
 * @return The individual items.
 */
std::vector<std::string> splitCommaList(const std::string& list);

/**
 * @brief Formats the current local time as an RFC 3339 timestamp
 *        ("YYYY-MM-DD HH:MM:SS+hh:mm").
 */
std::string currentTimestamp();

/**
 * @brief Generates a random alphanumeric string of the requested length.
 *
 * Characters are drawn uniformly from [A-Za-z0-9] using a std::mt19937
 * seeded from std::random_device.
 *
 * @param length Number of characters to produce.
 */
std::string generatePassword(std::size_t length = 12);

} // namespace Lempctl

#endif // UTILS_HPP
