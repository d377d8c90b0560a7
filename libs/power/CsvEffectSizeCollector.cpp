#include "CsvEffectSizeCollector.h"
#include <iomanip>
#include <limits>
#include "PsePowerException.h"

namespace psepower::diagnostics
{
  CsvEffectSizeCollector::CsvEffectSizeCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    m_ofs.open(m_filepath, std::ios::out | std::ios::trunc);
    if (!m_ofs.is_open()) {
      throw ConfigurationException("failed to open effect-size output file: " + m_filepath);
    }

    m_ofs << std::setprecision(std::numeric_limits<double>::digits10);
    writeHeader();
  }

  CsvEffectSizeCollector::~CsvEffectSizeCollector() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvEffectSizeCollector::writeHeader()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_ofs << "replication,effect,statistic,df_effect,df_error,p_value,pes,cohens_f,"
          << "complete_subjects,excluded_subjects,invalid_pse\n";
    m_ofs.flush();
  }

  void CsvEffectSizeCollector::onReplicationResult(const power::ReplicationResult& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open() || !r.analysis) return;

    const std::size_t invalid = r.invalidEstimates();
    for (const auto& e : r.analysis->effects) {
      // Effect names such as "(Intercept)" never contain commas, so no quoting
      m_ofs << (r.replication + 1) << ","
            << e.effectName << ","
            << e.statistic << ","
            << e.dfEffect << ","
            << e.dfError << ","
            << e.pValue << ","
            << e.partialEtaSquared << ","
            << e.cohensF << ","
            << r.analysis->completeSubjects << ","
            << r.analysis->excludedSubjects << ","
            << invalid << "\n";
    }

    m_ofs.flush();
  }
} // namespace psepower::diagnostics
