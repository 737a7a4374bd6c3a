#pragma once

#include <fstream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>

namespace taindicators
{
namespace app
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously,
 * typically the console and a log file
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Destination for engine log messages.
 *
 * Writes to std::clog, and additionally to a file when one is opened.
 */
class LogSink
{
public:
    LogSink();

    /**
     * @brief Mirror all further messages into the given file (truncated)
     * @throws std::runtime_error if the file cannot be opened
     */
    void openFile(const std::string& path);

    void write(const std::string& message);

    std::ostream& stream();

private:
    std::unique_ptr<std::ofstream> mFile;
    std::unique_ptr<TeeStream> mTee;
};

} // namespace app
} // namespace taindicators
