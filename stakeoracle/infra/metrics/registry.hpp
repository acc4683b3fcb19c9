// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stakeoracle::metrics {

//! Ordered label name/value pairs
using Labels = std::vector<std::pair<std::string, std::string>>;

class Gauge {
  public:
    void set(double value) { value_ = value; }
    double value() const { return value_; }

  private:
    double value_{0};
};

//! Monotonic counter, exposed with the _total suffix
class Counter {
  public:
    void increment(double amount = 1.0);
    double value() const { return value_; }

  private:
    double value_{0};
};

class Histogram {
  public:
    //! Same defaults as the official Prometheus client libraries
    static const std::vector<double> kDefaultBuckets;

    explicit Histogram(std::vector<double> upper_bounds = kDefaultBuckets);

    void observe(double value);

    const std::vector<double>& upper_bounds() const { return upper_bounds_; }

    //! Cumulative count for each upper bound, +Inf excluded
    std::vector<uint64_t> cumulative_counts() const;

    uint64_t count() const { return count_; }
    double sum() const { return sum_; }

  private:
    std::vector<double> upper_bounds_;
    std::vector<uint64_t> bucket_counts_;
    uint64_t count_{0};
    double sum_{0};
};

//! Collection of metric families rendered in the Prometheus text exposition format (version 0.0.4)
//! \warning Not thread-safe: register, update and serialize from the same executor
class Registry {
  public:
    //! \param prefix optional namespace, metric names become <prefix>_<name>
    explicit Registry(std::string prefix = {});

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    //! Return the metric registered under the given name and labels, creating it on first use
    //! \throws std::invalid_argument if the name is already registered with another type
    Gauge& gauge(const std::string& name, const std::string& help, const Labels& labels = {});
    Counter& counter(const std::string& name, const std::string& help, const Labels& labels = {});
    Histogram& histogram(const std::string& name, const std::string& help, const Labels& labels = {},
                         const std::vector<double>& upper_bounds = Histogram::kDefaultBuckets);

    std::string serialize() const;

    const std::string& prefix() const { return prefix_; }

  private:
    enum class Type {
        kGauge,
        kCounter,
        kHistogram,
    };

    struct Family {
        Type type;
        std::string help;
        std::map<Labels, std::unique_ptr<Gauge>> gauges;
        std::map<Labels, std::unique_ptr<Counter>> counters;
        std::map<Labels, std::unique_ptr<Histogram>> histograms;
    };

    Family& family(const std::string& name, Type type, const std::string& help);

    std::string prefix_;
    std::map<std::string, Family> families_;
};

//! \brief Format a sample value the way Prometheus clients do (integral values without decimals)
std::string format_value(double value);

//! \brief Escape a label value: backslash, double quote and line feed
std::string escape_label_value(const std::string& value);

}  // namespace stakeoracle::metrics
