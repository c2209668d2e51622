#pragma once
#include "IDiagnosticsObserver.h"
#include <fstream>
#include <mutex>
#include <string>

namespace treestat::diagnostics {

// Appends one CSV row per bootstrap run. The header is written only when
// the file is new or empty.
class CsvBootstrapCollector : public IBootstrapObserver {
public:
    explicit CsvBootstrapCollector(const std::string& filepath);
    ~CsvBootstrapCollector();

    void onBootstrapCompleted(const BootstrapRecord& record) override;

private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
    bool m_headerWritten = false;
};

} // namespace treestat::diagnostics
