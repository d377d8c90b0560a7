#pragma once
#include "IPowerRunObserver.h"
#include <fstream>
#include <mutex>
#include <string>

namespace psepower::diagnostics {

/**
 * @brief Writes the per-replication effect-size table, one row per
 * (replication, effect). Replications that could not be analysed add no rows.
 *
 * Columns: replication,effect,statistic,df_effect,df_error,p_value,pes,
 * cohens_f,complete_subjects,excluded_subjects,invalid_pse
 */
class CsvEffectSizeCollector : public IPowerRunObserver {
public:
    explicit CsvEffectSizeCollector(const std::string& filepath);
    ~CsvEffectSizeCollector() override;

    void onReplicationResult(const power::ReplicationResult& result) override;

    const std::string& getFilePath() const { return m_filepath; }

private:
    void writeHeader();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
};

} // namespace psepower::diagnostics
