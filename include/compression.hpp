/**
 * @file compression.hpp
 * @brief Gzip stage of the backup pipeline.
 *
 * @note Requires zlib.
 */

#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <string>
#include "backup_error.hpp"

/**
 * @brief Compresses inputFile into outputFile in gzip format.
 *
 * @return Result<void> Io error on any read or write failure. outputFile is removed on failure.
 */
Result<void> gzipFile(const std::string& inputFile, const std::string& outputFile);

/**
 * @brief Decompresses a gzip file.
 *
 * @return Result<void> Format error for data that is not valid gzip, Io error otherwise.
 * outputFile is removed on failure.
 */
Result<void> gunzipFile(const std::string& inputFile, const std::string& outputFile);

#endif // COMPRESSION_HPP
