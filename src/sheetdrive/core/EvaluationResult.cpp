#include "sheetdrive/core/EvaluationResult.hpp"
#include <cmath>
#include <fmt/format.h>

namespace sheetdrive {
namespace core {

namespace {
const std::string kEmptyText;
}

const std::string& EvaluationResult::textValue() const noexcept {
    return isText() ? std::get<1>(value_) : kEmptyText;
}

std::string EvaluationResult::toString() const {
    if (isText()) {
        return std::get<1>(value_);
    }
    // fmt 默认使用最短往返表示：5.0 -> "5"，0.1 -> "0.1"
    return fmt::format("{}", std::get<0>(value_));
}

bool EvaluationResult::operator==(const EvaluationResult& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    if (isText()) {
        return std::get<1>(value_) == std::get<1>(other.value_);
    }
    double a = std::get<0>(value_);
    double b = std::get<0>(other.value_);
    if (std::isnan(a) && std::isnan(b)) {
        return true;
    }
    return a == b;
}

}} // namespace sheetdrive::core
