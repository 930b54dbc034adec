#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace hypotest
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to write reports to the console and to a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Write the character to both buffers
     * @return EOF if either write failed, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Local time as "YYYYMMDD_HHMMSS", e.g. "20241025_143012"
 */
std::string getCurrentTimestamp();

/**
 * @brief Build "<directory>/<prefix>_<timestamp>.log"
 *
 * The directory is created if it does not exist. An empty directory puts the
 * file in the working directory.
 */
std::string createLogFileName(const std::string& directory, const std::string& prefix);

} // namespace utils
} // namespace hypotest
