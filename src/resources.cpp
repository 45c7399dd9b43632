#include "bsl_translate/resources.hpp"
#include "bsl_translate/landmarks.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace bsl {
namespace analysis {

namespace {

std::string trim_ws(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parse_int(const std::string& s, int& out)
{
    std::string t = trim_ws(s);
    if (t.empty())
        return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < 0 || v > 1000000)
        return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_float_list(const std::string& line, std::vector<float>& out)
{
    out.clear();
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        std::string t = trim_ws(field);
        if (t.empty())
            return false;
        char* end = nullptr;
        errno = 0;
        float v = std::strtof(t.c_str(), &end);
        if (errno != 0 || *end != '\0')
            return false;
        out.push_back(v);
    }
    return !out.empty();
}

} // namespace

bool Vocabulary::load_from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Resources] Failed to open vocabulary: " << path << "\n";
        return false;
    }
    return load_from_stream(file);
}

bool Vocabulary::load_from_stream(std::istream& in)
{
    std::map<int, std::string> labels;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim_ws(line);
        if (line.empty())
            continue;

        auto comma = line.find(',');
        int index = 0;
        if (comma == std::string::npos || !parse_int(line.substr(0, comma), index)) {
            std::cerr << "[Resources] Malformed vocabulary line " << line_no << ": " << line << "\n";
            return false;
        }
        std::string label = trim_ws(line.substr(comma + 1));
        if (label.empty()) {
            std::cerr << "[Resources] Empty label on vocabulary line " << line_no << "\n";
            return false;
        }
        if (!labels.emplace(index, label).second) {
            std::cerr << "[Resources] Duplicate class index " << index << " on line " << line_no << "\n";
            return false;
        }
    }

    if (labels.empty()) {
        std::cerr << "[Resources] Vocabulary is empty\n";
        return false;
    }
    labels_ = std::move(labels);
    std::cerr << "[Resources] Read vocabulary, " << labels_.size() << " signs\n";
    return true;
}

bool Vocabulary::lookup(int index, std::string& label) const
{
    auto it = labels_.find(index);
    if (it == labels_.end())
        return false;
    label = it->second;
    return true;
}

bool NormalizationTable::load_from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Resources] Failed to open normalization stats: " << path << "\n";
        return false;
    }
    return load_from_stream(file);
}

bool NormalizationTable::load_from_stream(std::istream& in)
{
    std::vector<std::vector<float>> rows;
    std::string line;
    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty())
            continue;
        std::vector<float> row;
        if (!parse_float_list(line, row)) {
            std::cerr << "[Resources] Malformed normalization row " << rows.size() + 1 << "\n";
            return false;
        }
        rows.push_back(std::move(row));
    }
    if (rows.size() != 2) {
        std::cerr << "[Resources] Normalization stats need 2 rows (means, scales), got " << rows.size() << "\n";
        return false;
    }
    return assign(std::move(rows[0]), std::move(rows[1]));
}

bool NormalizationTable::assign(std::vector<float> means, std::vector<float> scales)
{
    constexpr size_t kRequired = landmarks::constants::kLandmarksPerHand * landmarks::constants::kAxes;
    if (means.size() != scales.size()) {
        std::cerr << "[Resources] Normalization means/scales length mismatch: "
                  << means.size() << " vs " << scales.size() << "\n";
        return false;
    }
    if (means.size() < kRequired) {
        std::cerr << "[Resources] Normalization stats too short: " << means.size()
                  << " < " << kRequired << "\n";
        return false;
    }
    for (size_t i = 0; i < scales.size(); ++i) {
        if (scales[i] == 0.0f) {
            std::cerr << "[Resources] Zero scale at normalization index " << i << "\n";
            return false;
        }
    }
    if (means.size() != static_cast<size_t>(landmarks::constants::kCoordsPerFrame))
        std::cerr << "[Resources][WARN] Normalization stats have " << means.size()
                  << " entries, expected " << landmarks::constants::kCoordsPerFrame << "\n";

    means_ = std::move(means);
    scales_ = std::move(scales);
    return true;
}

} // namespace analysis
} // namespace bsl
