#include "OutputUtils.h"
#include <algorithm>
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace cadenceopt
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

std::streamsize TeeBuf::xsputn(const char* s, std::streamsize n)
{
    const std::streamsize n1 = mStreamBuf1->sputn(s, n);
    const std::streamsize n2 = mStreamBuf2->sputn(s, n);
    return std::min(n1, n2);
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

void ensureOutputDirectory(const std::string& outputDir)
{
    fs::path dir(outputDir);

    if (fs::exists(dir))
    {
        if (!fs::is_directory(dir))
            throw std::runtime_error("Output path exists and is not a directory: " + outputDir);
        return;
    }

    fs::create_directories(dir);
}

std::string makeOutputPath(const std::string& outputDir, const std::string& fileName)
{
    return (fs::path(outputDir) / fileName).string();
}

} // namespace utils
} // namespace cadenceopt
