#ifndef KS_SAMPLE_FILE_H
#define KS_SAMPLE_FILE_H
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

// Sample files are headerless, single-column text files: one value per
// line.  Blank lines are skipped, and leading or trailing whitespace
// is ignored.
namespace ks {
// Appends the values in `in` to `out`.  On a malformed line, returns
// false and describes the line in `error`; `out` then holds the values
// read before that line.
bool ParseSamples(std::istream& in, std::vector<double>* out,
                  std::string* error);
bool ParseSamples(std::istream& in, std::vector<int64_t>* out,
                  std::string* error);

// Reads the sample file at `path`.  Prints a diagnostic to stderr and
// aborts if the file can't be opened or parsed.
std::vector<double> ReadDoubleSamplesOrDie(const std::string& path);
std::vector<int64_t> ReadIntegerSamplesOrDie(const std::string& path);
}  // namespace ks
#endif /* !KS_SAMPLE_FILE_H */
