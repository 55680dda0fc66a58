#pragma once

#include <string>
#include <sys/stat.h>
#include <sys/types.h>

/**
 * @brief Creates directory @p path with all missing parents (like mkdir -p)
 * @details Already existing components are not an error, which makes it safe to
 *   call concurrently for overlapping paths.
 *
 * @return 0 on success, -1 on error (errno is set)
 */
int mkdir_r(std::string path, mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO) noexcept;

/**
 * @brief Removes @p path recursively, symbolic links are removed, never followed
 *
 * @return 0 on success, -1 on error (errno is set)
 */
int remove_r(const std::string& path) noexcept;
