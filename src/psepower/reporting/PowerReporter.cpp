#include "PowerReporter.h"
#include <iomanip>
#include <optional>

namespace psepower
{
namespace reporting
{

namespace
{
    void writeOptional(std::ostream& os, const std::optional<double>& value, int width)
    {
        if (value)
            os << std::setw(width) << *value;
        else
            os << std::setw(width) << "NA";
    }
}

void PowerReporter::writeRunReport(std::ostream& os,
                                   const power::PowerRunSettings& settings,
                                   const power::PowerRunResult& result)
{
    writeSectionHeader(os, "PSE Power Analysis");
    os << "Subjects: " << settings.subjectCount << std::endl;
    os << "Replicate trials per cell: " << settings.trialCount << std::endl;
    os << "Contrast assignment: "
       << simulation::contrastAssignmentName(settings.contrastAssignment) << "-subject" << std::endl;
    os << "Excluded proportion: " << settings.excludedProportion << std::endl;
    os << "Replications: " << settings.replications << std::endl;
    os << "Seed: " << settings.seed << std::endl;
    os << "Alpha: " << settings.alpha << std::endl;
    writeSectionFooter(os);
    os << std::endl;

    writeEffectTable(os, result);
    os << std::endl;
    writeDiagnostics(os, result);
}

void PowerReporter::writeEffectTable(std::ostream& os, const power::PowerRunResult& result)
{
    writeSectionHeader(os, "Cohen's f by effect");

    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();

    os << std::left << std::setw(16) << "effect" << std::right
       << std::setw(6) << "n"
       << std::setw(10) << "mean"
       << std::setw(10) << "median"
       << std::setw(10) << "sd"
       << std::setw(10) << "min"
       << std::setw(10) << "max"
       << std::setw(10) << "power" << std::endl;

    os << std::fixed << std::setprecision(4);
    for (const auto& name : power::effectNames())
    {
        auto summary = result.getSummary(name);
        if (!summary)
            continue;

        os << std::left << std::setw(16) << name << std::right
           << std::setw(6) << summary->getCount();
        writeOptional(os, summary->getMean(), 10);
        writeOptional(os, summary->getMedian(), 10);
        writeOptional(os, summary->getStdDev(), 10);
        writeOptional(os, summary->getMin(), 10);
        writeOptional(os, summary->getMax(), 10);
        writeOptional(os, summary->getEmpiricalPower(), 10);
        os << std::endl;
    }

    os.flags(flags);
    os.precision(precision);
    writeSectionFooter(os);
}

void PowerReporter::writeDiagnostics(std::ostream& os, const power::PowerRunResult& result)
{
    writeSectionHeader(os, "Run diagnostics");
    os << "Replications analysed: " << result.getAnalysedReplications()
       << " of " << result.getReplicationCount() << std::endl;
    os << "Replications not analysable: " << result.getUnanalysableReplications() << std::endl;
    os << "Replications with invalid PSE groups: " << result.getReplicationsWithInvalidPse() << std::endl;
    os << "Invalid PSE groups: " << result.getInvalidPseCount() << std::endl;
    for (const auto& count : result.getFailureCounts())
        os << "  " << fitFailureName(count.first) << ": " << count.second << std::endl;
    os << "Subjects excluded listwise: " << result.getExcludedSubjectCount() << std::endl;
    writeSectionFooter(os);
}

void PowerReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void PowerReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace psepower
