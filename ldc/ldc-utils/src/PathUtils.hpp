#ifndef LDC_UTILS_PATH_UTILS_HPP
#define LDC_UTILS_PATH_UTILS_HPP

#include <filesystem>
#include <string>

namespace ldc_utils
{

/**
 * Directory containing the running executable.
 *
 * @throws std::runtime_error if the executable path cannot be determined
 */
std::filesystem::path executableDirectory();

/**
 * Convert a string path to an absolute filesystem path relative to the
 * directory containing the current executable.
 *
 * @param relativePath The path string relative to the executable directory
 * @return An absolute, lexically normalized path (need not exist)
 *
 * Example:
 *   If executable is at: /opt/loadicator/bin/loadicator
 *   And relativePath is: "../data/MV_Del_Monte_Ship_Data.db"
 *   Returns: /opt/loadicator/data/MV_Del_Monte_Ship_Data.db
 */
std::filesystem::path absolutePath(const std::string& relativePath);

/**
 * Resolve a user-supplied data file path.
 *
 * Absolute paths are returned normalized. Relative paths that exist from the
 * working directory are taken as given; anything else is resolved against
 * the executable directory via absolutePath().
 */
std::filesystem::path resolveDataPath(const std::string& path);

}  // namespace ldc_utils

#endif  // LDC_UTILS_PATH_UTILS_HPP
