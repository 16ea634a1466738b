#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @brief Small filesystem helpers shared by the driver and the output writer.
 */
class FileUtils {
public:
    /** @brief Joins two path fragments with the platform separator. */
    static std::string joinPaths(const std::string& base, const std::string& leaf);

    /**
     * @brief Creates the directory (and parents) if it does not exist.
     * @return true if the directory exists afterwards.
     */
    static bool ensureDirectoryExists(const std::string& path);

    static bool fileExists(const std::string& path);
};

#endif // FILE_UTILS_HPP
