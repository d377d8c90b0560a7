#include "OutputUtils.h"
#include "PsePowerException.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace psepower
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
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string createEffectSizeFileName(unsigned int subjects, unsigned int trials)
{
    return "PsePower_EffectSizes_" + std::to_string(subjects) + "subj_"
        + std::to_string(trials) + "trials_" + getCurrentTimestamp() + ".csv";
}

RunOutputs::RunOutputs(const std::string& effectSizeFile, const std::string& logFile)
    : mEffectSizeFileName(effectSizeFile)
{
    if (!logFile.empty())
    {
        mLogFile.open(logFile);
        if (!mLogFile.is_open())
            throw ConfigurationException("cannot open log file " + logFile);
        mTee = std::make_unique<TeeStream>(std::cout, mLogFile);
    }

    mCollector = std::make_shared<diagnostics::CsvEffectSizeCollector>(mEffectSizeFileName);
}

std::ostream& RunOutputs::log()
{
    if (mTee)
        return *mTee;
    return std::cout;
}

} // namespace utils
} // namespace psepower
