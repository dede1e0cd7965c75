#include "csv.hpp"
#include "errors.hpp"
#include <fstream>

// --- CSV Parsing Implementation ---

std::string stripOuterQuotes(const std::string &s) {
  std::string result = s;
  // Trim whitespace/CR/LF
  while (!result.empty() && (result.back() == '\r' || result.back() == '\n' ||
                             result.back() == ' ' || result.back() == '\t'))
    result.pop_back();
  while (!result.empty() && (result.front() == ' ' || result.front() == '\t'))
    result.erase(result.begin());

  // Some exports wrap the entire row in one layer of quotes: "a,b,c".
  // Only unwrap when the interior has no quotes of its own, so that rows of
  // individually quoted fields ("a","b") are left intact.
  if (result.size() >= 2 && result.front() == '"' && result.back() == '"' &&
      result.find('"', 1) == result.size() - 1) {
    result = result.substr(1, result.size() - 2);
  }
  return result;
}

namespace {
const char UTF8_BOM[] = "\xEF\xBB\xBF";

bool isPadding(char c) { return c == ' ' || c == '\t'; }

std::string trimmed(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isPadding(s[begin]))
    ++begin;
  while (end > begin && isPadding(s[end - 1]))
    --end;
  return s.substr(begin, end - begin);
}
} // namespace

// Splits one row into trimmed cells. Quoted cells may hold commas and
// doubled quotes; a leading byte order mark is dropped.
std::vector<std::string> parseCSVLine(const std::string &rawLine) {
  std::string line = stripOuterQuotes(rawLine);
  if (line.compare(0, 3, UTF8_BOM) == 0)
    line.erase(0, 3);

  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;
  size_t i = 0;
  while (i < line.size()) {
    char c = line[i++];
    if (quoted && c == '"' && i < line.size() && line[i] == '"') {
      cell += '"';
      ++i;
    } else if (c == '"') {
      quoted = !quoted;
    } else if (!quoted && c == ',') {
      cells.push_back(trimmed(cell));
      cell.clear();
    } else {
      cell += c;
    }
  }
  cells.push_back(trimmed(cell));
  return cells;
}

namespace {
bool isBlank(const std::string &line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

int CsvTable::columnIndex(const std::string &name) const {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name)
      return static_cast<int>(i);
  }
  return -1;
}

CsvTable parseCsvTable(const std::vector<std::string> &lines,
                       const std::string &source) {
  CsvTable table;
  table.source = source;

  size_t i = 0;
  while (i < lines.size() && isBlank(lines[i]))
    ++i;
  if (i == lines.size())
    throw DataIntegrityError(source + ": missing header row");

  table.header = parseCSVLine(lines[i]);

  for (++i; i < lines.size(); ++i) {
    if (isBlank(lines[i]))
      continue;
    table.rows.push_back(parseCSVLine(lines[i]));
  }
  return table;
}

CsvTable readCsvTable(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open())
    throw DataIntegrityError("cannot open " + filename);

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line))
    lines.push_back(line);
  return parseCsvTable(lines, filename);
}
