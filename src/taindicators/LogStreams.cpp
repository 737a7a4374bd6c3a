#include "LogStreams.h"
#include <iostream>
#include <stdexcept>

namespace taindicators
{
namespace app
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

LogSink::LogSink()
    : mFile(),
      mTee()
{
}

void LogSink::openFile(const std::string& path)
{
    std::unique_ptr<std::ofstream> file(new std::ofstream(path, std::ios::out | std::ios::trunc));
    if (!file->is_open())
    {
        throw std::runtime_error("Cannot open log file for writing: " + path);
    }

    mTee.reset(new TeeStream(std::clog, *file));
    mFile = std::move(file);
}

void LogSink::write(const std::string& message)
{
    stream() << "[taindicators] " << message << std::endl;
}

std::ostream& LogSink::stream()
{
    if (mTee)
        return *mTee;

    return std::clog;
}

} // namespace app
} // namespace taindicators
