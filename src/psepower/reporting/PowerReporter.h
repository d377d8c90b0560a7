#pragma once

#include <ostream>
#include <string>
#include "PowerRunTypes.h"

namespace psepower
{
namespace reporting
{

/**
 * @brief Writes the end-of-run summary of a power analysis
 *
 * One line per effect with the distribution of Cohen's f and the empirical
 * power at the run's alpha, followed by the run diagnostics.
 */
class PowerReporter
{
public:
    static void writeRunReport(std::ostream& os,
                               const power::PowerRunSettings& settings,
                               const power::PowerRunResult& result);

private:
    static void writeEffectTable(std::ostream& os, const power::PowerRunResult& result);
    static void writeDiagnostics(std::ostream& os, const power::PowerRunResult& result);
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace psepower
