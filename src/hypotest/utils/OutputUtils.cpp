#include "OutputUtils.h"
#include <algorithm>
#include <filesystem>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace hypotest
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string getCurrentTimestamp()
{
    // to_iso_string gives YYYYMMDDTHHMMSS for a whole-second clock
    std::string stamp = boost::posix_time::to_iso_string(
        boost::posix_time::second_clock::local_time());
    std::replace(stamp.begin(), stamp.end(), 'T', '_');
    return stamp;
}

std::string createLogFileName(const std::string& directory, const std::string& prefix)
{
    const std::string fileName = prefix + "_" + getCurrentTimestamp() + ".log";
    if (directory.empty())
        return fileName;

    std::filesystem::create_directories(directory);
    return (std::filesystem::path(directory) / fileName).string();
}

} // namespace utils
} // namespace hypotest
