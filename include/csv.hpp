#ifndef CSV_HPP
#define CSV_HPP

#include <string>
#include <vector>

std::string stripOuterQuotes(const std::string &s);
std::vector<std::string> parseCSVLine(const std::string &rawLine);

// Header plus raw string rows, in file order.
struct CsvTable {
  std::string source; // file name or label used in error messages
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  // Index of a header column, or -1 if absent.
  int columnIndex(const std::string &name) const;
};

// Throws DataIntegrityError if the file cannot be opened or has no header.
CsvTable readCsvTable(const std::string &filename);

// Builds a table from in-memory lines; the first line is the header.
CsvTable parseCsvTable(const std::vector<std::string> &lines,
                       const std::string &source);

#endif // CSV_HPP
