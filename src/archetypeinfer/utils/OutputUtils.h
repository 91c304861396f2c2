#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace archetypeinfer
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send the run log to the console and the log file at once.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Write a character to both buffers
     * @return EOF if either buffer fails, otherwise the character written
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
 * @brief Path of an output file inside the output directory
 *
 * The directory is created if it does not exist.
 *
 * @param outputDir Directory that receives the run's output files
 * @param fileName  Bare file name, e.g. "summary.json"
 * @return Full path to the file as a string
 */
std::string createOutputFilePath(const std::string& outputDir, const std::string& fileName);

} // namespace utils
} // namespace archetypeinfer
