// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __DATA_TABLE_CSV_READER_H
#define __DATA_TABLE_CSV_READER_H 1

#include <string>

#include "TreestatException.h"
#include "DataTable.h"

namespace treestat
{
  // A data file is missing its header or has a row of the wrong width.
  class DataFileError : public TreestatException
  {
  public:
    explicit DataFileError(const std::string& msg)
      : TreestatException(msg)
    {}
  };

  /**
   * @class DataTableCsvReader
   * @brief Reads a comma separated file with a header line into a DataTable.
   *
   * A column whose every cell parses as a number becomes a numeric column;
   * any other column is kept as labels. Cells are trimmed of surrounding
   * whitespace and blank lines are skipped.
   */
  class DataTableCsvReader
  {
  public:
    explicit DataTableCsvReader(const std::string& fileName);

    // @throws DataFileError for a missing header or a ragged row.
    void readFile();

    const statistics::DataTable& getDataTable() const
    {
      return mTable;
    }

  private:
    std::string           mFileName;
    statistics::DataTable mTable;
  };
}

#endif
