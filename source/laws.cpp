// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <lager_optics/laws.h>
#include <lager_optics/log.h>

#include <algorithm>
#include <sstream>

namespace lager_optics {

void LawReport::record(std::string_view law_name, std::size_t sample_index, std::string detail)
{
    ++failed;
    detail::log_law_violation(subject, law_name, sample_index, detail);

    if (violations.size() < LAGER_OPTICS_LAW_REPORT_LIMIT) {
        violations.push_back(LawViolation{std::string{law_name}, sample_index, std::move(detail)});
    }
}

bool LawReport::violated(std::string_view law_name) const
{
    return std::any_of(violations.begin(), violations.end(),
                       [law_name](const LawViolation& v) { return v.law == law_name; });
}

std::string LawReport::to_string() const
{
    std::ostringstream os;
    os << subject << ": " << (checked - failed) << "/" << checked << " expectations held";
    for (const auto& v : violations) {
        os << "\n  " << v.law << " [sample " << v.sample_index << "]";
        if (!v.detail.empty()) {
            os << ": " << v.detail;
        }
    }
    if (failed > violations.size()) {
        os << "\n  ... " << (failed - violations.size()) << " more";
    }
    return os.str();
}

void LawReport::throw_if_failed() const
{
    if (!passed()) {
        detail::log_diagnostic("LawReport::throw_if_failed", subject);
        throw LawViolationError(to_string());
    }
}

} // namespace lager_optics
