#include "ks/sample-file.h"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace ks {
namespace {
bool ParseValue(absl::string_view text, double* out) {
  return absl::SimpleAtod(text, out);
}

bool ParseValue(absl::string_view text, int64_t* out) {
  return absl::SimpleAtoi(text, out);
}

template <typename T>
bool ParseLines(std::istream& in, std::vector<T>* out, std::string* error) {
  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;

    const absl::string_view text = absl::StripAsciiWhitespace(line);
    if (text.empty()) {
      continue;
    }

    T value;
    if (!ParseValue(text, &value)) {
      *error = absl::StrCat("line ", line_number, ": cannot parse \"", text,
                            "\"");
      return false;
    }

    out->push_back(value);
  }

  if (in.bad()) {
    *error = absl::StrCat("read error after line ", line_number);
    return false;
  }

  return true;
}

template <typename T>
std::vector<T> ReadSamplesOrDie(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "Unable to open sample file " << path << "." << std::endl;
    abort();
  }

  std::vector<T> ret;
  std::string error;
  if (!ParseSamples(file, &ret, &error)) {
    std::cerr << "Malformed sample file " << path << ", " << error << "."
              << std::endl;
    abort();
  }

  return ret;
}
}  // namespace

bool ParseSamples(std::istream& in, std::vector<double>* out,
                  std::string* error) {
  return ParseLines(in, out, error);
}

bool ParseSamples(std::istream& in, std::vector<int64_t>* out,
                  std::string* error) {
  return ParseLines(in, out, error);
}

std::vector<double> ReadDoubleSamplesOrDie(const std::string& path) {
  return ReadSamplesOrDie<double>(path);
}

std::vector<int64_t> ReadIntegerSamplesOrDie(const std::string& path) {
  return ReadSamplesOrDie<int64_t>(path);
}
}  // namespace ks
