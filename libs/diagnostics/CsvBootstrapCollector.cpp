#include "CsvBootstrapCollector.h"
#include <stdexcept>
#include <filesystem>
#include <system_error>

namespace treestat::diagnostics
{
  CsvBootstrapCollector::CsvBootstrapCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    // An unreadable size is treated like a missing file: write the header.
    std::error_code ec;
    if (std::filesystem::exists(m_filepath, ec)) {
      const auto size = std::filesystem::file_size(m_filepath, ec);
      if (!ec && size > 0) {
        m_headerWritten = true;
      }
    }

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open()) {
      throw std::runtime_error("Failed to open diagnostic file: " + m_filepath);
    }

    if (!m_headerWritten) {
      writeHeaderIfNeeded();
    }
  }

  CsvBootstrapCollector::~CsvBootstrapCollector() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvBootstrapCollector::writeHeaderIfNeeded()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_headerWritten) return;

    m_ofs << "Mode,Draws,NewDraws,Rows,Clusters,OutcomeDim,Seed,Workers\n";

    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvBootstrapCollector::onBootstrapCompleted(const BootstrapRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open()) return;

    m_ofs << toString(r.getMode()) << ","
          << r.getNumDraws() << ","
          << r.getNumNewDraws() << ","
          << r.getNumRows() << ",";

    // empty cell for i.i.d. sampling
    if (r.getNumClusters() > 0)
      m_ofs << r.getNumClusters();

    m_ofs << ","
          << r.getOutcomeDim() << ","
          << r.getSeed() << ","
          << r.getNumWorkers() << "\n";

    m_ofs.flush();
  }
} // namespace treestat::diagnostics
