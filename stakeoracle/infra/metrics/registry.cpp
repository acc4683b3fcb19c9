// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "registry.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stakeoracle::metrics {

const std::vector<double> Histogram::kDefaultBuckets{
    0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0, 7.5, 10.0};

void Counter::increment(double amount) {
    if (amount < 0) {
        throw std::invalid_argument{"counter increment must be non-negative"};
    }
    value_ += amount;
}

Histogram::Histogram(std::vector<double> upper_bounds)
    : upper_bounds_{std::move(upper_bounds)},
      bucket_counts_(upper_bounds_.size(), 0) {
    if (!std::is_sorted(upper_bounds_.cbegin(), upper_bounds_.cend())) {
        throw std::invalid_argument{"histogram bucket bounds must be sorted"};
    }
}

void Histogram::observe(double value) {
    const auto it = std::lower_bound(upper_bounds_.cbegin(), upper_bounds_.cend(), value);
    if (it != upper_bounds_.cend()) {
        ++bucket_counts_[static_cast<size_t>(it - upper_bounds_.cbegin())];
    }
    ++count_;
    sum_ += value;
}

std::vector<uint64_t> Histogram::cumulative_counts() const {
    std::vector<uint64_t> cumulative(bucket_counts_.size(), 0);
    uint64_t total{0};
    for (size_t i{0}; i < bucket_counts_.size(); ++i) {
        total += bucket_counts_[i];
        cumulative[i] = total;
    }
    return cumulative;
}

Registry::Registry(std::string prefix) : prefix_{std::move(prefix)} {}

Registry::Family& Registry::family(const std::string& name, Type type, const std::string& help) {
    const auto full_name = prefix_.empty() ? name : prefix_ + "_" + name;
    auto [it, inserted] = families_.try_emplace(full_name, Family{type, help, {}, {}, {}});
    if (!inserted && it->second.type != type) {
        throw std::invalid_argument{"metric " + full_name + " already registered with another type"};
    }
    return it->second;
}

Gauge& Registry::gauge(const std::string& name, const std::string& help, const Labels& labels) {
    auto& gauges = family(name, Type::kGauge, help).gauges;
    auto& gauge = gauges[labels];
    if (!gauge) gauge = std::make_unique<Gauge>();
    return *gauge;
}

Counter& Registry::counter(const std::string& name, const std::string& help, const Labels& labels) {
    auto& counters = family(name, Type::kCounter, help).counters;
    auto& counter = counters[labels];
    if (!counter) counter = std::make_unique<Counter>();
    return *counter;
}

Histogram& Registry::histogram(const std::string& name, const std::string& help, const Labels& labels,
                               const std::vector<double>& upper_bounds) {
    auto& histograms = family(name, Type::kHistogram, help).histograms;
    auto& histogram = histograms[labels];
    if (!histogram) histogram = std::make_unique<Histogram>(upper_bounds);
    return *histogram;
}

static void write_labels(std::ostream& out, const Labels& labels, const std::pair<std::string, std::string>* extra = nullptr) {
    if (labels.empty() && !extra) return;
    out << "{";
    bool first{true};
    for (const auto& [name, value] : labels) {
        out << (first ? "" : ",") << name << "=\"" << escape_label_value(value) << "\"";
        first = false;
    }
    if (extra) {
        out << (first ? "" : ",") << extra->first << "=\"" << extra->second << "\"";
    }
    out << "}";
}

std::string Registry::serialize() const {
    std::ostringstream out;
    for (const auto& [name, family] : families_) {
        switch (family.type) {
            case Type::kGauge:
                out << "# HELP " << name << " " << family.help << "\n";
                out << "# TYPE " << name << " gauge\n";
                for (const auto& [labels, gauge] : family.gauges) {
                    out << name;
                    write_labels(out, labels);
                    out << " " << format_value(gauge->value()) << "\n";
                }
                break;
            case Type::kCounter:
                out << "# HELP " << name << "_total " << family.help << "\n";
                out << "# TYPE " << name << "_total counter\n";
                for (const auto& [labels, counter] : family.counters) {
                    out << name << "_total";
                    write_labels(out, labels);
                    out << " " << format_value(counter->value()) << "\n";
                }
                break;
            case Type::kHistogram:
                out << "# HELP " << name << " " << family.help << "\n";
                out << "# TYPE " << name << " histogram\n";
                for (const auto& [labels, histogram] : family.histograms) {
                    const auto cumulative = histogram->cumulative_counts();
                    for (size_t i{0}; i < cumulative.size(); ++i) {
                        const std::pair<std::string, std::string> le{"le", format_value(histogram->upper_bounds()[i])};
                        out << name << "_bucket";
                        write_labels(out, labels, &le);
                        out << " " << cumulative[i] << "\n";
                    }
                    const std::pair<std::string, std::string> le_inf{"le", "+Inf"};
                    out << name << "_bucket";
                    write_labels(out, labels, &le_inf);
                    out << " " << histogram->count() << "\n";
                    out << name << "_count";
                    write_labels(out, labels);
                    out << " " << histogram->count() << "\n";
                    out << name << "_sum";
                    write_labels(out, labels);
                    out << " " << format_value(histogram->sum()) << "\n";
                }
                break;
        }
    }
    return out.str();
}

std::string format_value(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
    std::ostringstream out;
    if (std::trunc(value) == value && std::fabs(value) < 1e15) {
        out << static_cast<int64_t>(value);
    } else {
        out << std::setprecision(std::numeric_limits<double>::digits10) << value;
    }
    return out.str();
}

std::string escape_label_value(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '\\':
                escaped += "\\\\";
                break;
            case '"':
                escaped += "\\\"";
                break;
            case '\n':
                escaped += "\\n";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

}  // namespace stakeoracle::metrics
