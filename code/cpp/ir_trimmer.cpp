#include "ir_trimmer.hpp"

std::vector<double> IRTrimmer::trim(const std::vector<double>& signal, std::size_t offset) {
    std::size_t start = peak_index(signal) + offset;
    if (start >= signal.size()) {
        return {};
    }
    return std::vector<double>(signal.begin() + start, signal.end());
}
