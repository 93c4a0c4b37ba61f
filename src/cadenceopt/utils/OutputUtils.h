#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace cadenceopt
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send the run log to the console and to the --log file at the
 * same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;

    std::streamsize xsputn(const char* s, std::streamsize n) override;

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
 * @brief Create the results directory (and any missing parents)
 * @param outputDir Directory that will receive the report files
 * @throws std::runtime_error if the path exists and is not a directory
 */
void ensureOutputDirectory(const std::string& outputDir);

/**
 * @brief Join a directory and a file name
 */
std::string makeOutputPath(const std::string& outputDir, const std::string& fileName);

} // namespace utils
} // namespace cadenceopt
