#pragma once

#include <fstream>
#include <memory>
#include <streambuf>
#include <ostream>
#include <string>
#include "CsvEffectSizeCollector.h"

namespace psepower
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Lets the run log go to the console and a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Handle character overflow by writing to both buffers
     * @return EOF on error, otherwise the character written
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
 * @brief Generate a timestamp string for file naming
 *
 * Format "MMM_DD_YYYY_HHMM", e.g. "Aug_25_2024_1430".
 */
std::string getCurrentTimestamp();

/**
 * @brief Default effect-size table name for a run, e.g.
 * "PsePower_EffectSizes_10subj_24trials_Aug_25_2024_1430.csv"
 */
std::string createEffectSizeFileName(unsigned int subjects, unsigned int trials);

/**
 * @brief Output sinks of one run: the log stream and the effect-size table
 *
 * The log file is opened before the effect-size table is created, so a bad
 * log path fails the run without leaving a table behind. An empty log file
 * name logs to the console only.
 *
 * @throws ConfigurationException if either file cannot be opened
 */
class RunOutputs
{
public:
    RunOutputs(const std::string& effectSizeFile, const std::string& logFile);

    RunOutputs(const RunOutputs&) = delete;
    RunOutputs& operator=(const RunOutputs&) = delete;

    std::ostream& log();

    std::shared_ptr<diagnostics::CsvEffectSizeCollector> getCollector() const
    {
        return mCollector;
    }

    const std::string& getEffectSizeFileName() const
    {
        return mEffectSizeFileName;
    }

private:
    std::ofstream mLogFile;
    std::unique_ptr<TeeStream> mTee;
    std::string mEffectSizeFileName;
    std::shared_ptr<diagnostics::CsvEffectSizeCollector> mCollector;
};

} // namespace utils
} // namespace psepower
