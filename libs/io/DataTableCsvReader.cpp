// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DataTableCsvReader.h"

#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace treestat
{
  static std::vector<std::string> splitLine(const std::string& line)
  {
    std::vector<std::string> fields;
    boost::algorithm::split(fields, line, boost::algorithm::is_any_of(","));
    for (auto& f : fields)
      boost::algorithm::trim(f);
    return fields;
  }

  DataTableCsvReader::DataTableCsvReader(const std::string& fileName)
    : mFileName(fileName),
      mTable()
  {}

  void DataTableCsvReader::readFile()
  {
    ::io::LineReader csvFile(mFileName);

    const char* headerLine = csvFile.next_line();
    if (headerLine == nullptr)
      throw DataFileError("DataTableCsvReader: " + mFileName + " has no header line");

    const std::vector<std::string> header = splitLine(headerLine);
    std::vector<std::vector<std::string>> cells(header.size());

    while (const char* line = csvFile.next_line())
      {
	std::string text(line);
	boost::algorithm::trim(text);
	if (text.empty())
	  continue;

	const std::vector<std::string> fields = splitLine(text);
	if (fields.size() != header.size())
	  throw DataFileError("DataTableCsvReader: line " + std::to_string(csvFile.get_file_line())
			      + " of " + mFileName + " has " + std::to_string(fields.size())
			      + " fields, expected " + std::to_string(header.size()));

	for (std::size_t c = 0; c < fields.size(); ++c)
	  cells[c].push_back(fields[c]);
      }

    statistics::DataTable table;
    for (std::size_t c = 0; c < header.size(); ++c)
      {
	std::vector<double> numbers;
	numbers.reserve(cells[c].size());

	bool numeric = true;
	for (const auto& cell : cells[c])
	  {
	    double value = 0.0;
	    if (!boost::conversion::try_lexical_convert(cell, value))
	      {
		numeric = false;
		break;
	      }
	    numbers.push_back(value);
	  }

	if (numeric)
	  table.addNumericColumn(header[c], std::move(numbers));
	else
	  table.addLabelColumn(header[c], std::move(cells[c]));
      }

    mTable = std::move(table);
  }
}
