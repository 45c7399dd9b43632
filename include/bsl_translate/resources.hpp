#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace bsl {
namespace analysis {

// Class index -> sign label, read from "index,label" lines
class Vocabulary {
public:
    Vocabulary() = default;

    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool load_from_stream(std::istream& in);

    // Returns false if the index has no label
    bool lookup(int index, std::string& label) const;

    bool contains(int index) const { return labels_.count(index) != 0; }
    size_t size() const { return labels_.size(); }
    bool empty() const { return labels_.empty(); }

private:
    std::map<int, std::string> labels_;
};

// Per-coordinate mean and scale. Line 1 holds the means, line 2 the scales.
// The entry for a landmark/axis is landmark * 3 + axis for both hands.
class NormalizationTable {
public:
    NormalizationTable() = default;

    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool load_from_stream(std::istream& in);

    // Direct construction (tests, embedded tables)
    [[nodiscard]] bool assign(std::vector<float> means, std::vector<float> scales);

    // (raw - mean[index]) / scale[index]
    float normalize(size_t index, float raw) const {
        return (raw - means_[index]) / scales_[index];
    }

    size_t size() const { return means_.size(); }
    bool empty() const { return means_.empty(); }

private:
    std::vector<float> means_;
    std::vector<float> scales_;
};

} // namespace analysis
} // namespace bsl
