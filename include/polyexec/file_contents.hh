#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes all @p count bytes, retrying on EINTR and short writes. Returns the
// number of bytes written, less than @p count only on error (errno is set).
size_t write_all(int fd, const void* buf, size_t count) noexcept;

/**
 * @brief Reads the contents of @p fd from offset @p beg, at most @p max_size bytes
 *
 * @errors Throws std::runtime_error if any read or seek fails
 */
std::string get_file_contents(int fd, off_t beg, size_t max_size);

// Reads the whole file @p path, throws std::runtime_error on error
std::string get_file_contents(const std::string& path);

/**
 * @brief Creates (or truncates) file @p path and writes @p data to it
 * @details The file is created with mode 0600.
 *
 * @errors Throws std::runtime_error if open(2) or write(2) fails
 */
void put_file_contents(const std::string& path, std::string_view data);
